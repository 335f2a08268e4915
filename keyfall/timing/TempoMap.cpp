#include "keyfall/timing/TempoMap.h"

#include <cmath>

namespace keyfall::timing {

TempoMap::TempoMap(int resolution, quint32 initialMicrosPerBeat)
    : m_resolution(resolution) {
    m_segments.front().microsPerBeat = initialMicrosPerBeat > 0 ? initialMicrosPerBeat : core::kDefaultMicrosPerBeat;
}

bool TempoMap::appendChange(qint64 tick, quint32 microsPerBeat) {
    if (microsPerBeat == 0 || m_resolution <= 0) return false;
    TempoSegment& last = m_segments.last();
    if (tick < last.startTick) return false;
    if (tick == last.startTick) {
        last.microsPerBeat = microsPerBeat;
        return true;
    }

    const double deltaBeats = double(tick - last.startTick) / double(m_resolution);
    TempoSegment seg;
    seg.startTick = tick;
    seg.startSeconds = last.startSeconds + deltaBeats * (double(last.microsPerBeat) * 1e-6);
    seg.microsPerBeat = microsPerBeat;
    m_segments.push_back(seg);
    return true;
}

const TempoSegment& TempoMap::segmentAt(qint64 tick) const {
    const TempoSegment* seg = &m_segments.front();
    for (const auto& s : m_segments) {
        if (s.startTick <= tick)
            seg = &s;
        else
            break;
    }
    return *seg;
}

bool operator==(const TempoSegment& a, const TempoSegment& b) {
    return a.startTick == b.startTick && a.microsPerBeat == b.microsPerBeat
        && std::abs(a.startSeconds - b.startSeconds) < 1e-9;
}

bool operator==(const TempoMap& a, const TempoMap& b) {
    return a.resolution() == b.resolution() && a.segments() == b.segments();
}

} // namespace keyfall::timing
