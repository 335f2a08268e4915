#pragma once

#include <QtGlobal>
#include <QVector>

namespace keyfall::core {

// Closed set of event kinds. Consumers switch over all of them (no default label)
// so a new kind is a compile-time warning everywhere it matters.
enum class EventKind {
    NoteOn,
    NoteOff,
    ControlChange,
    Meta,
};

// Meta payloads we consume. Everything else is dropped by the reader.
enum class MetaType {
    None,
    Tempo,
    EndOfTrack,
};

constexpr int kChannelCount = 16;
constexpr int kNoteCount = 128;
constexpr quint32 kDefaultMicrosPerBeat = 500000u; // 120 BPM
constexpr int kSustainController = 64;
constexpr int kAllNotesOffController = 123;

// Immutable once produced.
struct RawEvent {
    EventKind kind = EventKind::NoteOn;
    int channel = 0;  // 0..15
    int note = 0;     // 0..127 (note kinds)
    int velocity = 0; // 0..127 (note kinds)

    // Control change fields
    int controller = 0;
    int controlValue = 0;

    // Meta fields
    MetaType metaType = MetaType::None;
    quint32 microsPerBeat = 0; // MetaType::Tempo

    // Relative to the previous event of the same track (file input). Signed so a
    // corrupt producer can be detected instead of wrapping.
    qint64 tickDelta = 0;
    int sourceTrack = 0; // -1 for live input

    bool isNote() const { return kind == EventKind::NoteOn || kind == EventKind::NoteOff; }
    // NoteOff and NoteOn(velocity 0) are the same thing downstream.
    bool isNoteRelease() const {
        return kind == EventKind::NoteOff || (kind == EventKind::NoteOn && velocity == 0);
    }
    bool isNoteStart() const { return kind == EventKind::NoteOn && velocity > 0; }
    bool isTempo() const { return kind == EventKind::Meta && metaType == MetaType::Tempo; }

    static RawEvent noteOn(int channel, int note, int velocity, qint64 tickDelta = 0, int track = 0) {
        RawEvent e;
        e.kind = EventKind::NoteOn;
        e.channel = channel;
        e.note = note;
        e.velocity = velocity;
        e.tickDelta = tickDelta;
        e.sourceTrack = track;
        return e;
    }
    static RawEvent noteOff(int channel, int note, qint64 tickDelta = 0, int track = 0) {
        RawEvent e = noteOn(channel, note, 0, tickDelta, track);
        e.kind = EventKind::NoteOff;
        return e;
    }
    static RawEvent controlChange(int channel, int controller, int value, qint64 tickDelta = 0, int track = 0) {
        RawEvent e;
        e.kind = EventKind::ControlChange;
        e.channel = channel;
        e.controller = controller;
        e.controlValue = value;
        e.tickDelta = tickDelta;
        e.sourceTrack = track;
        return e;
    }
    static RawEvent tempo(quint32 microsPerBeat, qint64 tickDelta = 0, int track = 0) {
        RawEvent e;
        e.kind = EventKind::Meta;
        e.metaType = MetaType::Tempo;
        e.microsPerBeat = microsPerBeat;
        e.tickDelta = tickDelta;
        e.sourceTrack = track;
        return e;
    }
};

bool operator==(const RawEvent& a, const RawEvent& b);
inline bool operator!=(const RawEvent& a, const RawEvent& b) { return !(a == b); }

// What the file-parsing collaborator hands over: per-track event lists with
// relative tick deltas.
struct SourceTracks {
    int resolution = 480; // ticks per quarter note
    quint32 initialMicrosPerBeat = kDefaultMicrosPerBeat;
    QVector<QVector<RawEvent>> tracks;
};

} // namespace keyfall::core
