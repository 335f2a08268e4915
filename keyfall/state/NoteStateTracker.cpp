#include "keyfall/state/NoteStateTracker.h"

#include <algorithm>

namespace keyfall::state {

using core::EventKind;
using core::RawEvent;

namespace {
static bool validKey(int channel, int note) {
    return channel >= 0 && channel < core::kChannelCount && note >= 0 && note < core::kNoteCount;
}
} // namespace

bool NoteStateSnapshot::isActive(int channel, int note) const {
    if (!validKey(channel, note)) return false;
    const auto it = m_notes.constFind(NoteKey{channel, note}.packed());
    return it != m_notes.constEnd() && it->active;
}

bool NoteStateSnapshot::isSounding(int channel, int note) const {
    if (!validKey(channel, note)) return false;
    return m_notes.contains(NoteKey{channel, note}.packed());
}

NoteState NoteStateSnapshot::state(int channel, int note) const {
    if (!validKey(channel, note)) return {};
    return m_notes.value(NoteKey{channel, note}.packed());
}

bool NoteStateSnapshot::sustainOn(int channel) const {
    if (channel < 0 || channel >= core::kChannelCount) return false;
    return m_sustain[channel];
}

QVector<NoteKey> NoteStateSnapshot::activeSet() const {
    QVector<NoteKey> out;
    out.reserve(m_notes.size());
    for (auto it = m_notes.constBegin(); it != m_notes.constEnd(); ++it) {
        if (it->active) out.push_back(NoteKey::unpack(it.key()));
    }
    std::sort(out.begin(), out.end());
    return out;
}

int NoteStateSnapshot::activeCount() const {
    return int(std::count_if(m_notes.constBegin(), m_notes.constEnd(), [](const NoteState& s) { return s.active; }));
}

NoteStateTracker::NoteStateTracker(HandPolicy policy)
    : m_policy(policy)
    , m_current(std::make_shared<NoteStateSnapshot>()) {}

void NoteStateTracker::setHandPolicy(const HandPolicy& policy) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    m_policy = policy;
}

HandPolicy NoteStateTracker::handPolicy() const {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    return m_policy;
}

std::shared_ptr<const NoteStateSnapshot> NoteStateTracker::snapshot() const {
    std::lock_guard<std::mutex> lock(m_publishMutex);
    return m_current;
}

void NoteStateTracker::publish(std::shared_ptr<NoteStateSnapshot> next) {
    std::lock_guard<std::mutex> lock(m_publishMutex);
    next->m_revision = m_current->m_revision + 1;
    m_current = std::move(next);
}

void NoteStateTracker::apply(const RawEvent& ev, double timeSeconds) {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    auto next = std::make_shared<NoteStateSnapshot>(*snapshot());
    applyTo(*next, ev, timeSeconds);
    publish(std::move(next));
}

void NoteStateTracker::applyBatch(const QVector<TimedEvent>& events) {
    if (events.isEmpty()) return;
    std::lock_guard<std::mutex> lock(m_writeMutex);
    auto next = std::make_shared<NoteStateSnapshot>(*snapshot());
    for (const auto& te : events) applyTo(*next, te.event, te.timeSeconds);
    publish(std::move(next));
}

QVector<NoteKey> NoteStateTracker::allNotesOff() {
    std::lock_guard<std::mutex> lock(m_writeMutex);
    const auto prev = snapshot();
    QVector<NoteKey> swept;
    for (auto it = prev->m_notes.constBegin(); it != prev->m_notes.constEnd(); ++it) {
        swept.push_back(NoteKey::unpack(it.key()));
    }
    std::sort(swept.begin(), swept.end());
    publish(std::make_shared<NoteStateSnapshot>());
    return swept;
}

void NoteStateTracker::applyTo(NoteStateSnapshot& s, const RawEvent& ev, double timeSeconds) const {
    switch (ev.kind) {
    case EventKind::NoteOn:
    case EventKind::NoteOff: {
        if (!validKey(ev.channel, ev.note)) return;
        const quint16 key = NoteKey{ev.channel, ev.note}.packed();
        if (ev.isNoteStart()) {
            NoteState st;
            st.active = true;
            st.onVelocity = ev.velocity;
            st.onTimeSeconds = timeSeconds;
            st.hand = m_policy.handFor(ev.channel);
            s.m_notes.insert(key, st);
            return;
        }
        auto it = s.m_notes.find(key);
        if (it == s.m_notes.end()) return;
        if (s.m_sustain[ev.channel]) {
            it->active = false;
            it->sustained = true;
        } else {
            s.m_notes.erase(it);
        }
        return;
    }
    case EventKind::ControlChange: {
        if (ev.channel < 0 || ev.channel >= core::kChannelCount) return;
        if (ev.controller == core::kSustainController) {
            const bool down = ev.controlValue >= 64;
            s.m_sustain[ev.channel] = down;
            if (!down) {
                for (auto it = s.m_notes.begin(); it != s.m_notes.end();) {
                    const NoteKey k = NoteKey::unpack(it.key());
                    if (k.channel == ev.channel && !it->active)
                        it = s.m_notes.erase(it);
                    else
                        ++it;
                }
            }
        } else if (ev.controller == core::kAllNotesOffController) {
            for (auto it = s.m_notes.begin(); it != s.m_notes.end();) {
                if (NoteKey::unpack(it.key()).channel == ev.channel)
                    it = s.m_notes.erase(it);
                else
                    ++it;
            }
        }
        return;
    }
    case EventKind::Meta:
        return;
    }
}

} // namespace keyfall::state
