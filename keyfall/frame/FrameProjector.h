#pragma once

#include <QVector>
#include <QtGlobal>
#include <memory>

#include "keyfall/frame/KeyColor.h"
#include "keyfall/state/HandPolicy.h"
#include "keyfall/timeline/Timeline.h"

namespace keyfall::frame {

constexpr int kLowestKey = 21;   // A0
constexpr int kHighestKey = 108; // C8

struct KeyGeometry {
    int midiNote = 0;
    double x = 0.0; // left edge
    double width = 0.0;
    bool isBlack = false;
};

struct KeyboardLayout {
    QVector<KeyGeometry> keys; // ascending midi, 88 entries
    double whiteKeyWidth = 20.0;
    double blackKeyWidth = 12.0;
    double totalWidth = 0.0;
    quint32 revision = 0;

    const KeyGeometry* key(int midiNote) const {
        if (midiNote < kLowestKey || midiNote > kHighestKey || keys.size() != kHighestKey - kLowestKey + 1) return nullptr;
        return &keys[midiNote - kLowestKey];
    }
};

struct FrameGeometry {
    double canvasHeight = 600.0;
    double keyboardHeight = 80.0;
    double fallDistance = 520.0; // distance a note travels before it reaches the keyboard
    double noteHeight = 20.0;
    double whiteKeyWidth = 20.0;
    double blackKeyWidth = 12.0;
};

struct NoteProjection {
    double progress = 0.0; // 0 = just entered the lookahead, 1 = at the keyboard
    double position = 0.0; // canvasExtent * progress
    bool visible = false;
};

struct VisibleNote {
    int timelineIndex = -1;
    int midiNote = 0;
    int channel = 0;
    int velocity = 0;
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;
    double progress = 0.0;
    state::Hand hand = state::Hand::Right;
    bool isBlackKey = false;
    ColorKey colorKey;
};

struct Frame {
    QVector<VisibleNote> visibleNotes;
    std::shared_ptr<const KeyboardLayout> keyboard; // shared; unchanged between frames unless geometry changes
};

// Flying-notes geometry for an external renderer.
class FrameProjector {
public:
    explicit FrameProjector(const FrameGeometry& geometry = FrameGeometry());

    // progress = 1 - (noteStart - cursor) / lookahead; position = canvasExtent * progress.
    // Visible while 0 <= progress <= 1. lookahead <= 0 is never visible.
    static NoteProjection projectNotePosition(double noteStartSeconds,
                                              double cursorSeconds,
                                              double lookaheadSeconds,
                                              double canvasExtent);

    // 88 keys, white keys tiled left to right; black keys placed from a fixed
    // per-pitch-class offset table (black key spacing inside an octave is irregular).
    static KeyboardLayout layoutKeyboard(double whiteKeyWidth = 20.0, double blackKeyWidth = 12.0);

    void setGeometry(const FrameGeometry& geometry);
    const FrameGeometry& geometry() const { return m_geometry; }
    std::shared_ptr<const KeyboardLayout> keyboard() const { return m_keyboard; }

    // Note starts between the cursor and cursor + lookahead (wall seconds), projected
    // onto the canvas. Entries at endIndex and beyond are not shown (endIndex < 0
    // means the end of the timeline), nor are notes of an unselected hand. Pure apart
    // from reading the cached layout.
    Frame buildFrame(const timeline::Timeline& timeline,
                     int cursorIndex,
                     double cursorSeconds,
                     double lookaheadSeconds,
                     double tempoScalePercent,
                     const state::HandPolicy& hands,
                     int endIndex = -1,
                     state::HandSelection selection = state::HandSelection::Both) const;

private:
    FrameGeometry m_geometry;
    std::shared_ptr<const KeyboardLayout> m_keyboard;
    quint32 m_revision = 0;
};

} // namespace keyfall::frame
