#include "keyfall/engine/Snapshot.h"

#include <QJsonArray>

namespace keyfall::engine {

QJsonObject keyboardLayoutToJsonObject(const frame::KeyboardLayout& layout) {
    QJsonArray keys;
    for (const auto& k : layout.keys) {
        QJsonObject o;
        o.insert("midiNote", k.midiNote);
        o.insert("x", k.x);
        o.insert("width", k.width);
        o.insert("isBlack", k.isBlack);
        keys.append(o);
    }
    QJsonObject o;
    o.insert("revision", int(layout.revision));
    o.insert("whiteKeyWidth", layout.whiteKeyWidth);
    o.insert("blackKeyWidth", layout.blackKeyWidth);
    o.insert("totalWidth", layout.totalWidth);
    o.insert("keys", keys);
    return o;
}

QJsonObject snapshotToJsonObject(const Snapshot& s, bool includeKeyboardLayout) {
    QJsonArray active;
    for (const auto& n : s.activeNotes) {
        QJsonObject o;
        o.insert("channel", n.channel);
        o.insert("note", n.note);
        o.insert("hand", state::handName(n.hand));
        active.append(o);
    }

    QJsonArray predicted;
    for (const auto& p : s.predictionBatch.notes) {
        const auto hand = s.hands.handFor(p.entry.event.channel);
        QJsonObject o;
        o.insert("channel", p.entry.event.channel);
        o.insert("note", p.entry.event.note);
        o.insert("velocity", p.entry.event.velocity);
        o.insert("delaySeconds", p.delaySeconds);
        o.insert("hand", state::handName(hand));
        o.insert("colorKey", frame::colorKeyFor(hand, p.entry.event.note, true).path());
        predicted.append(o);
    }

    QJsonArray visible;
    for (const auto& v : s.frame.visibleNotes) {
        QJsonObject o;
        o.insert("midiNote", v.midiNote);
        o.insert("channel", v.channel);
        o.insert("velocity", v.velocity);
        o.insert("x", v.x);
        o.insert("y", v.y);
        o.insert("width", v.width);
        o.insert("height", v.height);
        o.insert("progress", v.progress);
        o.insert("hand", state::handName(v.hand));
        o.insert("isBlackKey", v.isBlackKey);
        o.insert("colorKey", v.colorKey.path());
        visible.append(o);
    }

    QJsonObject frameObj;
    frameObj.insert("visibleNotes", visible);
    if (s.frame.keyboard) {
        frameObj.insert("keyboardLayoutRevision", int(s.frame.keyboard->revision));
        if (includeKeyboardLayout) frameObj.insert("keyboardLayout", keyboardLayoutToJsonObject(*s.frame.keyboard));
    }

    QJsonObject o;
    o.insert("type", "frame_update");
    o.insert("sequence", qint64(s.sequence));
    o.insert("state", playbackStateName(s.state));
    o.insert("cursorSeconds", s.cursorSeconds);
    o.insert("cursorIndex", s.cursorIndex);
    o.insert("tempoScale", s.tempoScalePercent);
    o.insert("lookaheadSeconds", s.lookaheadSeconds);
    o.insert("activeNotes", active);
    o.insert("predictedNotes", predicted);
    o.insert("frame", frameObj);

    if (!s.tickErrors.isEmpty()) {
        QJsonArray errors;
        for (const auto& e : s.tickErrors) {
            QJsonObject eo;
            eo.insert("kind", core::errorKindName(e.kind));
            eo.insert("message", e.message);
            errors.append(eo);
        }
        o.insert("errors", errors);
    }
    return o;
}

} // namespace keyfall::engine
