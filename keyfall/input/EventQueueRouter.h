#pragma once

#include <QString>
#include <QVector>
#include <atomic>
#include <mutex>
#include <queue>

#include "keyfall/core/Errors.h"
#include "keyfall/core/MidiEvent.h"
#include "keyfall/engine/EngineClock.h"
#include "keyfall/state/NoteStateTracker.h"

namespace keyfall::input {

enum class EventSource {
    File,
    Live,
};

struct RoutedEvent {
    core::RawEvent event;
    double timestampSeconds = 0.0; // engine clock domain
    EventSource source = EventSource::File;
};

struct DrainReport {
    QVector<RoutedEvent> events; // merged, timestamp order
    int liveDropped = 0;         // oldest live events discarded since the previous drain
    bool deviceDisconnected = false;
    QVector<core::Error> errors; // QueueOverflow / DeviceDisconnected, for the side channel
};

// Two independent FIFOs (live input, file playback) merged once per scheduler tick.
//
// pushLive() is called from the device callback thread and never blocks on scheduler
// state beyond a short queue lock; when the live queue is full the oldest entry is
// dropped. The file queue is fed by the scheduler itself and is unbounded.
class EventQueueRouter {
public:
    static constexpr int kDefaultLiveCapacity = 256;

    explicit EventQueueRouter(const engine::EngineClock* clock, int liveCapacity = kDefaultLiveCapacity);

    // Rejects capacity <= 0 (InvalidConfiguration) and keeps the previous value.
    core::Error setLiveCapacity(int capacity);
    int liveCapacity() const;

    void pushLive(const core::RawEvent& ev);
    void pushLiveAt(const core::RawEvent& ev, double arrivalSeconds);
    void pushFile(const core::RawEvent& ev, double timestampSeconds);

    // Called by the device adapter when the live source goes away.
    void reportDeviceDisconnected(const QString& reason);

    // Dequeues everything available from both queues and merges by timestamp while
    // keeping per-queue FIFO order. On equal timestamps file events go first.
    DrainReport drain();

    // drain() + apply the merged events to the tracker in one batch.
    DrainReport drainInto(state::NoteStateTracker& tracker);

    void clear();
    int pendingLive() const;
    int pendingFile() const;
    quint64 totalLiveDropped() const { return m_totalLiveDropped.load(); }

private:
    const engine::EngineClock* m_clock = nullptr; // not owned

    mutable std::mutex m_liveMutex;
    std::queue<RoutedEvent> m_live;
    int m_liveCapacity = kDefaultLiveCapacity;
    int m_liveDroppedSinceDrain = 0;
    std::atomic<quint64> m_totalLiveDropped{0};

    mutable std::mutex m_fileMutex;
    std::queue<RoutedEvent> m_file;

    std::atomic<bool> m_deviceLost{false};
    QString m_deviceLostReason; // guarded by m_liveMutex
};

} // namespace keyfall::input
