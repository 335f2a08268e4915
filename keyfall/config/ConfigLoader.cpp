#include "keyfall/config/ConfigLoader.h"

#include <QDebug>
#include <QFile>

namespace keyfall::config {

using core::Error;
using core::ErrorKind;
using core::Outcome;

namespace {

static bool parseBool(const QString& s, bool fallback) {
    const QString t = s.trimmed().toLower();
    if (t == "true" || t == "1" || t == "yes") return true;
    if (t == "false" || t == "0" || t == "no") return false;
    return fallback;
}

static double readDouble(QXmlStreamReader& xml, double fallback) {
    bool ok = false;
    const double v = xml.readElementText().trimmed().toDouble(&ok);
    return ok ? v : fallback;
}

static int readInt(QXmlStreamReader& xml, int fallback) {
    bool ok = false;
    const int v = xml.readElementText().trimmed().toInt(&ok);
    return ok ? v : fallback;
}

static bool parseHand(const QString& s, state::Hand& out) {
    const QString t = s.trimmed().toLower();
    if (t == "left") {
        out = state::Hand::Left;
        return true;
    }
    if (t == "right") {
        out = state::Hand::Right;
        return true;
    }
    return false;
}

static bool parseHandSelection(const QString& s, state::HandSelection& out) {
    const QString t = s.trimmed().toLower();
    if (t == "both") {
        out = state::HandSelection::Both;
        return true;
    }
    state::Hand hand;
    if (!parseHand(t, hand)) return false;
    out = hand == state::Hand::Left ? state::HandSelection::Left : state::HandSelection::Right;
    return true;
}

} // namespace

Error validateConfig(const EngineConfig& c) {
    auto bad = [](const QString& msg) { return Error{ErrorKind::InvalidConfiguration, msg}; };

    if (!(c.playback.tempoScalePercent > 0.0)) return bad("tempoScale must be > 0");
    if (c.playback.tickIntervalMs <= 0 || c.playback.tickIntervalMs > 1000) return bad("tickIntervalMs must be in 1..1000");

    const auto& la = c.lookahead;
    if (!(la.baseSeconds > 0.0)) return bad("lookahead baseSeconds must be > 0");
    if (la.skillLevel < 0.0 || la.songDifficulty < 0.0) return bad("lookahead skill/difficulty must be >= 0");
    if (!(la.maxSeconds > 0.0)) return bad("lookahead maxSeconds must be > 0");
    if (la.epsilonSeconds < 0.0) return bad("epsilonSeconds must be >= 0");
    if (la.maxScanEntries <= 0) return bad("maxScanEntries must be > 0");

    if (c.liveInput.queueCapacity <= 0) return bad("live queue capacity must be > 0");
    if (c.liveInput.portCheckIntervalMs <= 0) return bad("portCheckIntervalMs must be > 0");

    const auto& f = c.frame;
    if (!(f.canvasHeight > 0.0) || f.keyboardHeight < 0.0 || !(f.fallDistance > 0.0) || !(f.noteHeight > 0.0)) {
        return bad("frame canvas dimensions must be positive");
    }
    if (!(f.whiteKeyWidth > 0.0) || !(f.blackKeyWidth > 0.0) || f.blackKeyWidth > f.whiteKeyWidth) {
        return bad("key widths must be positive and black <= white");
    }

    const auto& p = c.practice;
    if (p.startPercent < 0.0 || p.endPercent > 100.0 || p.startPercent >= p.endPercent) {
        return bad(QString("practice range %1..%2 is not within 0..100").arg(p.startPercent).arg(p.endPercent));
    }
    return {};
}

Outcome<EngineConfig> ConfigLoader::loadFile(const QString& filePath) const {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        qWarning().noquote() << "ConfigLoader: could not open config file:" << filePath;
        return Outcome<EngineConfig>::failure(ErrorKind::InvalidConfiguration, QString("cannot open %1").arg(filePath));
    }
    QXmlStreamReader xml(&file);
    return parse(xml);
}

Outcome<EngineConfig> ConfigLoader::loadBytes(const QByteArray& bytes) const {
    QXmlStreamReader xml(bytes);
    return parse(xml);
}

Outcome<EngineConfig> ConfigLoader::parse(QXmlStreamReader& xml) const {
    EngineConfig cfg;
    if (!xml.readNextStartElement() || xml.name().toString() != "KeyfallConfig") {
        return Outcome<EngineConfig>::failure(ErrorKind::InvalidConfiguration, "root element must be <KeyfallConfig>");
    }

    while (xml.readNextStartElement()) {
        const QString section = xml.name().toString();
        if (section == "Playback") {
            parsePlayback(xml, cfg);
        } else if (section == "Lookahead") {
            parseLookahead(xml, cfg);
        } else if (section == "Hands") {
            parseHands(xml, cfg);
        } else if (section == "LiveInput") {
            parseLiveInput(xml, cfg);
        } else if (section == "Cache") {
            parseCache(xml, cfg);
        } else if (section == "Frame") {
            parseFrame(xml, cfg);
        } else if (section == "Practice") {
            parsePractice(xml, cfg);
        } else {
            xml.skipCurrentElement();
        }
    }

    if (xml.hasError()) {
        qWarning().noquote() << "ConfigLoader: XML parsing error:" << xml.errorString();
        return Outcome<EngineConfig>::failure(ErrorKind::InvalidConfiguration, xml.errorString());
    }

    const Error err = validateConfig(cfg);
    if (err.isError()) {
        qWarning().noquote() << "ConfigLoader:" << err.toString();
        return Outcome<EngineConfig>::failure(err);
    }
    return Outcome<EngineConfig>::success(cfg);
}

void ConfigLoader::parsePlayback(QXmlStreamReader& xml, EngineConfig& cfg) const {
    while (xml.readNextStartElement()) {
        const QString name = xml.name().toString();
        if (name == "TempoScale") {
            cfg.playback.tempoScalePercent = readDouble(xml, cfg.playback.tempoScalePercent);
        } else if (name == "TickIntervalMs") {
            cfg.playback.tickIntervalMs = readInt(xml, cfg.playback.tickIntervalMs);
        } else if (name == "AssignChannelsByTrack") {
            cfg.playback.assignChannelsByTrack = parseBool(xml.readElementText(), cfg.playback.assignChannelsByTrack);
        } else {
            xml.skipCurrentElement();
        }
    }
}

void ConfigLoader::parseLookahead(QXmlStreamReader& xml, EngineConfig& cfg) const {
    auto& la = cfg.lookahead;
    while (xml.readNextStartElement()) {
        const QString name = xml.name().toString();
        if (name == "BaseSeconds") {
            la.baseSeconds = readDouble(xml, la.baseSeconds);
        } else if (name == "SkillLevel") {
            la.skillLevel = readDouble(xml, la.skillLevel);
        } else if (name == "SongDifficulty") {
            la.songDifficulty = readDouble(xml, la.songDifficulty);
        } else if (name == "MaxSeconds") {
            la.maxSeconds = readDouble(xml, la.maxSeconds);
        } else if (name == "EpsilonSeconds") {
            la.epsilonSeconds = readDouble(xml, la.epsilonSeconds);
        } else if (name == "MaxScanEntries") {
            la.maxScanEntries = readInt(xml, la.maxScanEntries);
        } else {
            xml.skipCurrentElement();
        }
    }
}

// <Hands fallback="left"><Channel number="1" hand="right"/>...</Hands>
// Any <Channel> element replaces the built-in mapping entirely.
void ConfigLoader::parseHands(QXmlStreamReader& xml, EngineConfig& cfg) const {
    state::Hand fallback = cfg.hands.fallback();
    const QString fb = xml.attributes().value("fallback").toString();
    if (!fb.isEmpty() && !parseHand(fb, fallback)) {
        qWarning().noquote() << "ConfigLoader: unknown fallback hand" << fb;
    }
    cfg.hands.setFallback(fallback);

    bool cleared = false;
    while (xml.readNextStartElement()) {
        if (xml.name().toString() == "Channel") {
            bool ok = false;
            const int channel = xml.attributes().value("number").toInt(&ok);
            state::Hand hand;
            if (ok && channel >= 0 && channel < core::kChannelCount
                && parseHand(xml.attributes().value("hand").toString(), hand)) {
                if (!cleared) {
                    cfg.hands.clearAssignments();
                    cleared = true;
                }
                cfg.hands.assign(channel, hand);
            } else {
                qWarning().noquote() << "ConfigLoader: ignoring malformed <Channel> entry";
            }
        }
        xml.skipCurrentElement();
    }
}

void ConfigLoader::parseLiveInput(QXmlStreamReader& xml, EngineConfig& cfg) const {
    auto& li = cfg.liveInput;
    li.enabled = parseBool(xml.attributes().value("enabled").toString(), li.enabled);
    while (xml.readNextStartElement()) {
        const QString name = xml.name().toString();
        if (name == "PortName") {
            li.portName = xml.readElementText().trimmed();
        } else if (name == "QueueCapacity") {
            li.queueCapacity = readInt(xml, li.queueCapacity);
        } else if (name == "PortCheckIntervalMs") {
            li.portCheckIntervalMs = readInt(xml, li.portCheckIntervalMs);
        } else {
            xml.skipCurrentElement();
        }
    }
}

void ConfigLoader::parseCache(QXmlStreamReader& xml, EngineConfig& cfg) const {
    cfg.cache.enabled = parseBool(xml.attributes().value("enabled").toString(), cfg.cache.enabled);
    while (xml.readNextStartElement()) {
        if (xml.name().toString() == "Directory") {
            cfg.cache.directory = xml.readElementText().trimmed();
        } else {
            xml.skipCurrentElement();
        }
    }
}

void ConfigLoader::parseFrame(QXmlStreamReader& xml, EngineConfig& cfg) const {
    auto& f = cfg.frame;
    while (xml.readNextStartElement()) {
        const QString name = xml.name().toString();
        if (name == "CanvasHeight") {
            f.canvasHeight = readDouble(xml, f.canvasHeight);
        } else if (name == "KeyboardHeight") {
            f.keyboardHeight = readDouble(xml, f.keyboardHeight);
        } else if (name == "FallDistance") {
            f.fallDistance = readDouble(xml, f.fallDistance);
        } else if (name == "NoteHeight") {
            f.noteHeight = readDouble(xml, f.noteHeight);
        } else if (name == "WhiteKeyWidth") {
            f.whiteKeyWidth = readDouble(xml, f.whiteKeyWidth);
        } else if (name == "BlackKeyWidth") {
            f.blackKeyWidth = readDouble(xml, f.blackKeyWidth);
        } else {
            xml.skipCurrentElement();
        }
    }
}

void ConfigLoader::parsePractice(QXmlStreamReader& xml, EngineConfig& cfg) const {
    auto& p = cfg.practice;
    p.loop = parseBool(xml.attributes().value("loop").toString(), p.loop);
    p.showFutureNotes = parseBool(xml.attributes().value("showFutureNotes").toString(), p.showFutureNotes);
    const QString hands = xml.attributes().value("hands").toString();
    if (!hands.isEmpty() && !parseHandSelection(hands, p.hands)) {
        qWarning().noquote() << "ConfigLoader: unknown practice hands" << hands;
    }
    while (xml.readNextStartElement()) {
        const QString name = xml.name().toString();
        if (name == "StartPercent") {
            p.startPercent = readDouble(xml, p.startPercent);
        } else if (name == "EndPercent") {
            p.endPercent = readDouble(xml, p.endPercent);
        } else {
            xml.skipCurrentElement();
        }
    }
}

} // namespace keyfall::config
