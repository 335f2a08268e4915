#pragma once

#include <QHash>
#include <QVector>
#include <QtGlobal>
#include <array>
#include <memory>
#include <mutex>

#include "keyfall/core/MidiEvent.h"
#include "keyfall/state/HandPolicy.h"

namespace keyfall::state {

struct NoteKey {
    int channel = 0;
    int note = 0;

    quint16 packed() const { return quint16((channel & 0x0F) << 7 | (note & 0x7F)); }
    static NoteKey unpack(quint16 v) { return NoteKey{int(v >> 7) & 0x0F, int(v & 0x7F)}; }
};

inline bool operator==(const NoteKey& a, const NoteKey& b) { return a.channel == b.channel && a.note == b.note; }
inline bool operator<(const NoteKey& a, const NoteKey& b) {
    return a.channel != b.channel ? a.channel < b.channel : a.note < b.note;
}
inline size_t qHash(const NoteKey& k, size_t seed = 0) noexcept { return ::qHash(k.packed(), seed); }

struct NoteState {
    bool active = false;    // key is down
    bool sustained = false; // key released while the sustain pedal holds it
    int onVelocity = 0;
    double onTimeSeconds = 0.0;
    Hand hand = Hand::Left;
};

// Immutable view of the note table. Only sounding (active or sustained) notes are stored.
class NoteStateSnapshot {
public:
    bool isActive(int channel, int note) const;
    bool isSounding(int channel, int note) const;
    NoteState state(int channel, int note) const;
    bool sustainOn(int channel) const;

    // Sorted by (channel, note) so consumers get a stable order.
    QVector<NoteKey> activeSet() const;
    int activeCount() const;

    // Bumped once per applied batch.
    quint64 revision() const { return m_revision; }

private:
    friend class NoteStateTracker;

    QHash<quint16, NoteState> m_notes;
    std::array<bool, core::kChannelCount> m_sustain{};
    quint64 m_revision = 0;
};

struct TimedEvent {
    core::RawEvent event;
    double timeSeconds = 0.0;
};

// Single-writer note table.
//
// apply()/applyBatch()/allNotesOff() are serialized by one writer lock. Each write
// builds a new snapshot and publishes it with a pointer swap, so readers never wait
// on a writer and never see a half-applied event.
class NoteStateTracker {
public:
    explicit NoteStateTracker(HandPolicy policy = HandPolicy::defaults());

    void setHandPolicy(const HandPolicy& policy);
    HandPolicy handPolicy() const;

    void apply(const core::RawEvent& ev, double timeSeconds);
    void applyBatch(const QVector<TimedEvent>& events);

    // Clears every active/sustained note and the pedals. Returns the notes that were
    // still sounding.
    QVector<NoteKey> allNotesOff();

    bool isActive(int channel, int note) const { return snapshot()->isActive(channel, note); }
    QVector<NoteKey> activeSet() const { return snapshot()->activeSet(); }

    std::shared_ptr<const NoteStateSnapshot> snapshot() const;

private:
    void applyTo(NoteStateSnapshot& s, const core::RawEvent& ev, double timeSeconds) const;
    void publish(std::shared_ptr<NoteStateSnapshot> next);

    mutable std::mutex m_writeMutex;   // one writer at a time
    mutable std::mutex m_publishMutex; // guards the pointer swap only
    HandPolicy m_policy;
    std::shared_ptr<const NoteStateSnapshot> m_current;
};

} // namespace keyfall::state
