#include "keyfall/state/HandPolicy.h"

namespace keyfall::state {

HandPolicy::HandPolicy() {
    m_byChannel.fill(-1);
    m_byChannel[1] = int(Hand::Right);
    m_byChannel[2] = int(Hand::Left);
}

void HandPolicy::assign(int channel, Hand hand) {
    if (channel < 0 || channel >= int(m_byChannel.size())) return;
    m_byChannel[channel] = int(hand);
}

void HandPolicy::clearAssignments() {
    m_byChannel.fill(-1);
}

bool HandPolicy::isAssigned(int channel) const {
    if (channel < 0 || channel >= int(m_byChannel.size())) return false;
    return m_byChannel[channel] >= 0;
}

Hand HandPolicy::handFor(int channel) const {
    if (!isAssigned(channel)) return m_fallback;
    return Hand(m_byChannel[channel]);
}

bool HandPolicy::selects(HandSelection selection, int channel) const {
    switch (selection) {
    case HandSelection::Both: return true;
    case HandSelection::Right: return handFor(channel) == Hand::Right;
    case HandSelection::Left: return handFor(channel) == Hand::Left;
    }
    return true;
}

} // namespace keyfall::state
