#pragma once

#include <QString>

#include "keyfall/core/Errors.h"
#include "keyfall/frame/FrameProjector.h"
#include "keyfall/state/HandPolicy.h"

namespace keyfall::config {

struct PlaybackSettings {
    double tempoScalePercent = 100.0;
    int tickIntervalMs = 16;
    // Re-channel each track's notes to trackIndex + offset (offset 1 for two-track
    // files) so the hand policy can tell hands apart on single-channel files.
    bool assignChannelsByTrack = false;
};

struct LookaheadSettings {
    double baseSeconds = 2.0;
    double skillLevel = 0.0;
    double songDifficulty = 0.0;
    double maxSeconds = 30.0;
    double epsilonSeconds = 0.001;
    int maxScanEntries = 4096;
};

struct LiveInputSettings {
    bool enabled = false;
    QString portName; // substring match, case-insensitive; empty = first port
    int queueCapacity = 256;
    int portCheckIntervalMs = 1000;
};

struct CacheSettings {
    bool enabled = true;
    QString directory; // empty = <AppDataLocation>/timeline-cache
};

struct PracticeSettings {
    double startPercent = 0.0;
    double endPercent = 100.0;
    bool loop = false;
    state::HandSelection hands = state::HandSelection::Both; // filters predicted and falling notes
    bool showFutureNotes = true; // false: no upcoming-notes feed
};

struct EngineConfig {
    PlaybackSettings playback;
    LookaheadSettings lookahead;
    state::HandPolicy hands = state::HandPolicy::defaults();
    LiveInputSettings liveInput;
    CacheSettings cache;
    frame::FrameGeometry frame;
    PracticeSettings practice;
};

// First offending field wins. Never modifies the config.
core::Error validateConfig(const EngineConfig& config);

} // namespace keyfall::config
