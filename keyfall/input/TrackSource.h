#pragma once

#include <QString>

#include "keyfall/core/Errors.h"
#include "keyfall/core/MidiEvent.h"
#include "keyfall/input/SmfReader.h"

namespace keyfall::input {

// Where Loading gets its per-track events from.
class TrackSource {
public:
    virtual ~TrackSource() = default;
    virtual core::Outcome<core::SourceTracks> read(const QString& path) const = 0;
};

class SmfTrackSource final : public TrackSource {
public:
    explicit SmfTrackSource(bool assignChannelsByTrack = false)
        : m_assignChannels(assignChannelsByTrack) {}

    core::Outcome<core::SourceTracks> read(const QString& path) const override {
        auto out = readSmfFile(path);
        if (out.ok() && m_assignChannels) assignChannelsByTrack(out.value);
        return out;
    }

private:
    bool m_assignChannels = false;
};

} // namespace keyfall::input
