#pragma once

#include <QVector>
#include <QtGlobal>

#include "keyfall/core/Errors.h"
#include "keyfall/core/MidiEvent.h"
#include "keyfall/timing/TempoMap.h"

namespace keyfall::timeline {

struct TimelineEntry {
    qint64 absoluteTick = 0;
    double absoluteSeconds = 0.0; // derived, tempo scale 100%
    core::RawEvent event;         // NoteOff already normalized to NoteOn(velocity 0)
    int trackOrder = 0;           // position of the source track in the build input
};

bool operator==(const TimelineEntry& a, const TimelineEntry& b);

// Merged, cursor-addressable event sequence.
//
// Ordering: (absoluteTick, releases before note starts, trackOrder, order within track).
// Releases are ranked ahead of starts across tracks too, so a key retriggered at the
// same tick by another track never looks held twice.
class Timeline {
public:
    Timeline() = default;

    // Empty track set -> empty timeline. Negative deltas or resolution <= 0 ->
    // MalformedTimeline.
    static core::Outcome<Timeline> build(const QVector<QVector<core::RawEvent>>& tracks,
                                         int resolution,
                                         quint32 initialMicrosPerBeat = core::kDefaultMicrosPerBeat);
    static core::Outcome<Timeline> build(const core::SourceTracks& source);

    // Restores a timeline produced earlier (cache path). Entries must already be ordered.
    static core::Outcome<Timeline> fromEntries(QVector<TimelineEntry> entries, timing::TempoMap tempo);

    const QVector<TimelineEntry>& entries() const { return m_entries; }
    const TimelineEntry& at(int index) const { return m_entries.at(index); }
    int size() const { return m_entries.size(); }
    bool isEmpty() const { return m_entries.isEmpty(); }

    const timing::TempoMap& tempoMap() const { return m_tempo; }
    int resolution() const { return m_tempo.resolution(); }
    double durationSeconds() const { return m_entries.isEmpty() ? 0.0 : m_entries.last().absoluteSeconds; }
    int noteStartCount() const;

    // Number of entries at or before `seconds` (i.e. the cursor index for that time).
    int indexAfterSeconds(double seconds) const;

private:
    QVector<TimelineEntry> m_entries;
    timing::TempoMap m_tempo;
};

} // namespace keyfall::timeline
