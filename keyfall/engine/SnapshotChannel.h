#pragma once

#include <memory>
#include <mutex>

#include "keyfall/engine/Snapshot.h"

namespace keyfall::engine {

// Copy-on-publish mailbox between the tick loop (single writer) and the broadcast
// side (any number of readers). Readers hold their own reference; a publish never
// mutates a snapshot someone may still be reading.
class SnapshotChannel {
public:
    // Assigns the next sequence number. Returns it.
    quint64 publish(Snapshot s) {
        auto next = std::make_shared<Snapshot>(std::move(s));
        std::lock_guard<std::mutex> lock(m_mutex);
        next->sequence = ++m_sequence;
        m_latest = std::move(next);
        return m_sequence;
    }

    std::shared_ptr<const Snapshot> latest() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_latest;
    }

    quint64 sequence() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_sequence;
    }

private:
    mutable std::mutex m_mutex;
    std::shared_ptr<const Snapshot> m_latest;
    quint64 m_sequence = 0;
};

} // namespace keyfall::engine
