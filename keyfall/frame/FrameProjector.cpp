#include "keyfall/frame/FrameProjector.h"

namespace keyfall::frame {

namespace {

// Offset of a black key's center from the boundary between its two neighbouring
// white keys, at the reference white key width of 20.
static double blackKeyOffset(int pc) {
    switch (pc) {
    case 1: return -6.0;  // C#
    case 3: return 6.0;   // D#
    case 6: return -8.0;  // F#
    case 8: return 0.0;   // G#
    case 10: return 8.0;  // A#
    default: return 0.0;
    }
}

static constexpr double kReferenceWhiteWidth = 20.0;

} // namespace

FrameProjector::FrameProjector(const FrameGeometry& geometry) {
    setGeometry(geometry);
}

void FrameProjector::setGeometry(const FrameGeometry& geometry) {
    m_geometry = geometry;
    auto layout = std::make_shared<KeyboardLayout>(layoutKeyboard(geometry.whiteKeyWidth, geometry.blackKeyWidth));
    layout->revision = ++m_revision;
    m_keyboard = std::move(layout);
}

NoteProjection FrameProjector::projectNotePosition(double noteStartSeconds,
                                                   double cursorSeconds,
                                                   double lookaheadSeconds,
                                                   double canvasExtent) {
    NoteProjection p;
    if (!(lookaheadSeconds > 0.0)) return p;
    p.progress = 1.0 - (noteStartSeconds - cursorSeconds) / lookaheadSeconds;
    p.position = canvasExtent * p.progress;
    p.visible = p.progress >= 0.0 && p.progress <= 1.0;
    return p;
}

KeyboardLayout FrameProjector::layoutKeyboard(double whiteKeyWidth, double blackKeyWidth) {
    KeyboardLayout out;
    out.whiteKeyWidth = whiteKeyWidth;
    out.blackKeyWidth = blackKeyWidth;
    out.keys.reserve(kHighestKey - kLowestKey + 1);

    const double scale = whiteKeyWidth / kReferenceWhiteWidth;
    int whiteCount = 0;
    for (int midi = kLowestKey; midi <= kHighestKey; ++midi) {
        KeyGeometry k;
        k.midiNote = midi;
        k.isBlack = isBlackKey(midi);
        if (!k.isBlack) {
            k.x = whiteCount * whiteKeyWidth;
            k.width = whiteKeyWidth;
            ++whiteCount;
        } else {
            const double boundary = whiteCount * whiteKeyWidth;
            const double center = boundary + blackKeyOffset(midi % 12) * scale;
            k.x = center - blackKeyWidth * 0.5;
            k.width = blackKeyWidth;
        }
        out.keys.push_back(k);
    }
    out.totalWidth = whiteCount * whiteKeyWidth;
    return out;
}

Frame FrameProjector::buildFrame(const timeline::Timeline& timeline,
                                 int cursorIndex,
                                 double cursorSeconds,
                                 double lookaheadSeconds,
                                 double tempoScalePercent,
                                 const state::HandPolicy& hands,
                                 int endIndex,
                                 state::HandSelection selection) const {
    Frame frame;
    frame.keyboard = m_keyboard;
    if (!(tempoScalePercent > 0.0) || !(lookaheadSeconds > 0.0)) return frame;

    const double scale = 100.0 / tempoScalePercent;
    const double top = m_geometry.canvasHeight - m_geometry.keyboardHeight - m_geometry.fallDistance;

    const int end = endIndex < 0 ? timeline.size() : qMin(endIndex, timeline.size());
    for (int i = qMax(0, cursorIndex); i < end; ++i) {
        const auto& e = timeline.at(i);
        const double delay = (e.absoluteSeconds - cursorSeconds) * scale;
        if (delay > lookaheadSeconds) break;
        if (!e.event.isNoteStart() || !hands.selects(selection, e.event.channel)) continue;

        const KeyGeometry* key = m_keyboard->key(e.event.note);
        if (!key) continue;

        const NoteProjection p = projectNotePosition(delay, 0.0, lookaheadSeconds, m_geometry.fallDistance);
        if (!p.visible) continue;

        VisibleNote v;
        v.timelineIndex = i;
        v.midiNote = e.event.note;
        v.channel = e.event.channel;
        v.velocity = e.event.velocity;
        v.x = key->x;
        v.width = key->width;
        v.y = top + p.position;
        v.height = m_geometry.noteHeight;
        v.progress = p.progress;
        v.hand = hands.handFor(e.event.channel);
        v.isBlackKey = key->isBlack;
        v.colorKey = colorKeyFor(v.hand, v.midiNote, true);
        frame.visibleNotes.push_back(v);
    }
    return frame;
}

} // namespace keyfall::frame
