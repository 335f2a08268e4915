#pragma once

#include <array>

namespace keyfall::state {

enum class Hand {
    Left,
    Right,
};

inline const char* handName(Hand h) { return h == Hand::Left ? "left" : "right"; }

// Which hand the player practices; notes of the other hand are not expected.
enum class HandSelection {
    Both,
    Right,
    Left,
};

inline const char* handSelectionName(HandSelection s) {
    switch (s) {
    case HandSelection::Both: return "both";
    case HandSelection::Right: return "right";
    case HandSelection::Left: return "left";
    }
    return "both";
}

// Channel -> hand mapping supplied by configuration.
class HandPolicy {
public:
    HandPolicy();

    // Channel 1 -> right, channel 2 -> left, everything else left.
    static HandPolicy defaults() { return HandPolicy(); }

    void assign(int channel, Hand hand);
    void clearAssignments();
    void setFallback(Hand hand) { m_fallback = hand; }

    Hand handFor(int channel) const;
    bool selects(HandSelection selection, int channel) const;
    bool isAssigned(int channel) const;
    Hand fallback() const { return m_fallback; }

private:
    // -1 = unassigned, otherwise int(Hand)
    std::array<int, 16> m_byChannel{};
    Hand m_fallback = Hand::Left;
};

} // namespace keyfall::state
