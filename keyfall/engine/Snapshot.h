#pragma once

#include <QJsonObject>
#include <QString>
#include <QVector>
#include <QtGlobal>

#include "keyfall/core/Errors.h"
#include "keyfall/frame/FrameProjector.h"
#include "keyfall/predict/PredictionEngine.h"
#include "keyfall/state/HandPolicy.h"

namespace keyfall::engine {

enum class PlaybackState {
    Idle,
    Loading,
    Playing,
    Paused,
    Stopped,
};

inline const char* playbackStateName(PlaybackState s) {
    switch (s) {
    case PlaybackState::Idle: return "Idle";
    case PlaybackState::Loading: return "Loading";
    case PlaybackState::Playing: return "Playing";
    case PlaybackState::Paused: return "Paused";
    case PlaybackState::Stopped: return "Stopped";
    }
    return "Unknown";
}

struct ActiveNote {
    int channel = 0;
    int note = 0;
    int velocity = 0;
    state::Hand hand = state::Hand::Right;
};

// Immutable per-tick state handed to the broadcast side by value.
struct Snapshot {
    quint64 sequence = 0; // assigned by SnapshotChannel::publish()
    PlaybackState state = PlaybackState::Idle;
    double cursorSeconds = 0.0; // song time
    int cursorIndex = 0;
    double tempoScalePercent = 100.0;
    double lookaheadSeconds = 0.0;
    QVector<ActiveNote> activeNotes;
    predict::PredictionBatch predictionBatch;
    frame::Frame frame;
    state::HandPolicy hands;
    QVector<core::Error> tickErrors;
};

// Broadcast contract. The keyboard layout is embedded only when includeKeyboardLayout
// is set (consumers reuse the last one they received otherwise); its revision is
// always present.
QJsonObject snapshotToJsonObject(const Snapshot& s, bool includeKeyboardLayout);

QJsonObject keyboardLayoutToJsonObject(const frame::KeyboardLayout& layout);

} // namespace keyfall::engine
