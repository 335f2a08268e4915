#include "keyfall/engine/Session.h"

#include <cmath>

namespace keyfall::engine {

using core::ErrorKind;
using core::Outcome;

Outcome<PracticeRange> practiceRangeFor(int entryCount, double startPercent, double endPercent) {
    if (startPercent < 0.0 || endPercent > 100.0 || !(startPercent < endPercent)) {
        return Outcome<PracticeRange>::failure(ErrorKind::InvalidConfiguration,
                                               QString("practice range %1..%2 is not within 0..100")
                                                   .arg(startPercent)
                                                   .arg(endPercent));
    }
    const int n = qMax(0, entryCount);
    PracticeRange r;
    r.begin = qBound(0, int(std::floor(startPercent * n / 100.0)), n);
    r.end = qBound(r.begin, int(std::floor(endPercent * n / 100.0)), n);
    return Outcome<PracticeRange>::success(r);
}

Session::Session(timeline::Timeline timeline, timeline::SourceIdentity source, bool fromCache)
    : m_timeline(std::move(timeline)), m_source(std::move(source)), m_fromCache(fromCache) {
    m_range.end = m_timeline.size();
}

Session Session::liveOnly() {
    return Session();
}

core::Error Session::setPracticeRange(double startPercent, double endPercent) {
    const auto r = practiceRangeFor(m_timeline.size(), startPercent, endPercent);
    if (!r.ok()) return r.error;
    m_range = r.value;
    if (m_cursorIndex < m_range.begin || m_cursorIndex > m_range.end) rewindToRangeStart();
    return {};
}

double Session::rangeStartSeconds() const {
    // Playing from the top keeps the lead-in before the first event.
    if (m_range.begin == 0) return 0.0;
    if (m_range.begin >= m_timeline.size()) return m_timeline.durationSeconds();
    return m_timeline.at(m_range.begin).absoluteSeconds;
}

void Session::setCursor(int index, double seconds) {
    m_cursorIndex = index;
    m_cursorSeconds = seconds;
}

void Session::rewindToRangeStart() {
    m_cursorIndex = m_range.begin;
    m_cursorSeconds = rangeStartSeconds();
}

} // namespace keyfall::engine
