#pragma once

#include <QVector>
#include <QtGlobal>

#include "keyfall/core/MidiEvent.h"

namespace keyfall::timing {

// Piecewise-constant tempo: one segment per tempo change, ascending by startTick.
struct TempoSegment {
    qint64 startTick = 0;
    double startSeconds = 0.0; // unscaled song time at startTick
    quint32 microsPerBeat = core::kDefaultMicrosPerBeat;
};

// Invariant: segments is never empty, the first segment starts at tick 0 and
// startTick is non-decreasing.
class TempoMap {
public:
    TempoMap() = default;
    explicit TempoMap(int resolution, quint32 initialMicrosPerBeat = core::kDefaultMicrosPerBeat);

    int resolution() const { return m_resolution; }
    const QVector<TempoSegment>& segments() const { return m_segments; }

    // Appends a tempo change. A change at the same tick as the last segment replaces
    // its tempo. Returns false (map untouched) for a tick earlier than the last change
    // or a zero tempo.
    bool appendChange(qint64 tick, quint32 microsPerBeat);

    // Last segment whose startTick <= tick. Linear scan is fine: maps are tiny.
    const TempoSegment& segmentAt(qint64 tick) const;
    quint32 microsPerBeatAt(qint64 tick) const { return segmentAt(tick).microsPerBeat; }

private:
    int m_resolution = 480;
    QVector<TempoSegment> m_segments{TempoSegment{}};
};

bool operator==(const TempoSegment& a, const TempoSegment& b);
bool operator==(const TempoMap& a, const TempoMap& b);

} // namespace keyfall::timing
