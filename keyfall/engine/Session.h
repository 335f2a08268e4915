#pragma once

#include "keyfall/core/Errors.h"
#include "keyfall/timeline/Timeline.h"
#include "keyfall/timeline/TimelineCache.h"

namespace keyfall::engine {

// Entry index range [begin, end) selected for practice.
struct PracticeRange {
    int begin = 0;
    int end = 0;

    bool isEmpty() const { return end <= begin; }
    int size() const { return qMax(0, end - begin); }
};

// floor(percent * entryCount / 100) for both ends. Rejects percentages outside
// 0..100 or start >= end.
core::Outcome<PracticeRange> practiceRangeFor(int entryCount, double startPercent, double endPercent);

// Everything that belongs to the song currently loaded. Created by a successful
// Loading and replaced as a whole by the next one; the scheduler is its only writer.
class Session {
public:
    Session() = default;
    Session(timeline::Timeline timeline, timeline::SourceIdentity source, bool fromCache);

    // Free play: no timeline, live input only.
    static Session liveOnly();

    const timeline::Timeline& timeline() const { return m_timeline; }
    const timeline::SourceIdentity& source() const { return m_source; }
    bool isLiveOnly() const { return m_timeline.isEmpty(); }
    bool loadedFromCache() const { return m_fromCache; }

    core::Error setPracticeRange(double startPercent, double endPercent);
    const PracticeRange& range() const { return m_range; }
    double rangeStartSeconds() const;

    // Cursor, song time. cursorIndex counts entries already handed to the router.
    int cursorIndex() const { return m_cursorIndex; }
    double cursorSeconds() const { return m_cursorSeconds; }
    void setCursor(int index, double seconds);
    void rewindToRangeStart();
    bool atRangeEnd() const { return !isLiveOnly() && m_cursorIndex >= m_range.end; }

private:
    timeline::Timeline m_timeline;
    timeline::SourceIdentity m_source;
    bool m_fromCache = false;
    PracticeRange m_range;
    int m_cursorIndex = 0;
    double m_cursorSeconds = 0.0;
};

} // namespace keyfall::engine
