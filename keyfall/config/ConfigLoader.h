#pragma once

#include <QByteArray>
#include <QString>
#include <QXmlStreamReader>

#include "keyfall/config/EngineConfig.h"
#include "keyfall/core/Errors.h"

namespace keyfall::config {

// Reads <KeyfallConfig> XML. Missing elements keep their defaults, unknown elements
// are skipped. The result is validated before it is returned.
class ConfigLoader {
public:
    core::Outcome<EngineConfig> loadFile(const QString& filePath) const;
    core::Outcome<EngineConfig> loadBytes(const QByteArray& xml) const;

private:
    core::Outcome<EngineConfig> parse(QXmlStreamReader& xml) const;

    void parsePlayback(QXmlStreamReader& xml, EngineConfig& cfg) const;
    void parseLookahead(QXmlStreamReader& xml, EngineConfig& cfg) const;
    void parseHands(QXmlStreamReader& xml, EngineConfig& cfg) const;
    void parseLiveInput(QXmlStreamReader& xml, EngineConfig& cfg) const;
    void parseCache(QXmlStreamReader& xml, EngineConfig& cfg) const;
    void parseFrame(QXmlStreamReader& xml, EngineConfig& cfg) const;
    void parsePractice(QXmlStreamReader& xml, EngineConfig& cfg) const;
};

} // namespace keyfall::config
