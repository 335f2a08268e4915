#pragma once

#include <QString>

#include "keyfall/state/HandPolicy.h"

namespace keyfall::frame {

enum class KeyColorClass {
    White,
    Black,
};

inline bool isBlackKey(int midiNote) {
    switch (((midiNote % 12) + 12) % 12) {
    case 1: case 3: case 6: case 8: case 10: return true;
    default: return false;
    }
}

// Lookup key into the external palette: (hand, key color class, upcoming).
struct ColorKey {
    state::Hand hand = state::Hand::Right;
    KeyColorClass keyClass = KeyColorClass::White;
    bool upcoming = false;

    // e.g. "left_hand/black_keys/upcoming"
    QString path() const {
        return QString("%1_hand/%2_keys/%3")
            .arg(state::handName(hand))
            .arg(keyClass == KeyColorClass::Black ? "black" : "white")
            .arg(upcoming ? "upcoming" : "current");
    }
};

inline bool operator==(const ColorKey& a, const ColorKey& b) {
    return a.hand == b.hand && a.keyClass == b.keyClass && a.upcoming == b.upcoming;
}

inline ColorKey colorKeyFor(state::Hand hand, int midiNote, bool upcoming) {
    return ColorKey{hand, isBlackKey(midiNote) ? KeyColorClass::Black : KeyColorClass::White, upcoming};
}

} // namespace keyfall::frame
