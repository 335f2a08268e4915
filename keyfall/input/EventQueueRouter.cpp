#include "keyfall/input/EventQueueRouter.h"

namespace keyfall::input {

using core::Error;
using core::ErrorKind;
using core::RawEvent;

EventQueueRouter::EventQueueRouter(const engine::EngineClock* clock, int liveCapacity)
    : m_clock(clock)
    , m_liveCapacity(liveCapacity > 0 ? liveCapacity : kDefaultLiveCapacity) {}

Error EventQueueRouter::setLiveCapacity(int capacity) {
    if (capacity <= 0) {
        return Error{ErrorKind::InvalidConfiguration, QString("live queue capacity must be > 0 (got %1)").arg(capacity)};
    }
    std::lock_guard<std::mutex> lock(m_liveMutex);
    m_liveCapacity = capacity;
    while (int(m_live.size()) > m_liveCapacity) {
        m_live.pop();
        ++m_liveDroppedSinceDrain;
        ++m_totalLiveDropped;
    }
    return {};
}

int EventQueueRouter::liveCapacity() const {
    std::lock_guard<std::mutex> lock(m_liveMutex);
    return m_liveCapacity;
}

void EventQueueRouter::pushLive(const RawEvent& ev) {
    pushLiveAt(ev, m_clock ? m_clock->nowSeconds() : 0.0);
}

void EventQueueRouter::pushLiveAt(const RawEvent& ev, double arrivalSeconds) {
    RoutedEvent r;
    r.event = ev;
    r.event.sourceTrack = -1;
    r.timestampSeconds = arrivalSeconds;
    r.source = EventSource::Live;

    std::lock_guard<std::mutex> lock(m_liveMutex);
    while (int(m_live.size()) >= m_liveCapacity) {
        m_live.pop();
        ++m_liveDroppedSinceDrain;
        ++m_totalLiveDropped;
    }
    m_live.push(r);
}

void EventQueueRouter::pushFile(const RawEvent& ev, double timestampSeconds) {
    RoutedEvent r;
    r.event = ev;
    r.timestampSeconds = timestampSeconds;
    r.source = EventSource::File;

    std::lock_guard<std::mutex> lock(m_fileMutex);
    m_file.push(r);
}

void EventQueueRouter::reportDeviceDisconnected(const QString& reason) {
    {
        std::lock_guard<std::mutex> lock(m_liveMutex);
        m_deviceLostReason = reason;
    }
    m_deviceLost.store(true);
}

DrainReport EventQueueRouter::drain() {
    DrainReport report;

    std::queue<RoutedEvent> live;
    std::queue<RoutedEvent> file;
    QString lostReason;
    {
        std::lock_guard<std::mutex> lock(m_liveMutex);
        std::swap(live, m_live);
        report.liveDropped = m_liveDroppedSinceDrain;
        m_liveDroppedSinceDrain = 0;
        lostReason = m_deviceLostReason;
    }
    {
        std::lock_guard<std::mutex> lock(m_fileMutex);
        std::swap(file, m_file);
    }

    report.events.reserve(int(live.size() + file.size()));
    while (!live.empty() || !file.empty()) {
        const bool takeFile = live.empty()
            || (!file.empty() && file.front().timestampSeconds <= live.front().timestampSeconds);
        if (takeFile) {
            report.events.push_back(file.front());
            file.pop();
        } else {
            report.events.push_back(live.front());
            live.pop();
        }
    }

    if (report.liveDropped > 0) {
        report.errors.push_back(Error{ErrorKind::QueueOverflow,
                                      QString("dropped %1 oldest live events").arg(report.liveDropped)});
    }
    if (m_deviceLost.exchange(false)) {
        report.deviceDisconnected = true;
        report.errors.push_back(Error{ErrorKind::DeviceDisconnected, lostReason});
    }
    return report;
}

DrainReport EventQueueRouter::drainInto(state::NoteStateTracker& tracker) {
    DrainReport report = drain();
    QVector<state::TimedEvent> batch;
    batch.reserve(report.events.size());
    for (const auto& r : report.events) batch.push_back(state::TimedEvent{r.event, r.timestampSeconds});
    tracker.applyBatch(batch);
    return report;
}

void EventQueueRouter::clear() {
    {
        std::lock_guard<std::mutex> lock(m_liveMutex);
        m_live = {};
        m_liveDroppedSinceDrain = 0;
    }
    std::lock_guard<std::mutex> lock(m_fileMutex);
    m_file = {};
}

int EventQueueRouter::pendingLive() const {
    std::lock_guard<std::mutex> lock(m_liveMutex);
    return int(m_live.size());
}

int EventQueueRouter::pendingFile() const {
    std::lock_guard<std::mutex> lock(m_fileMutex);
    return int(m_file.size());
}

} // namespace keyfall::input
