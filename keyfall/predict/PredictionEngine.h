#pragma once

#include <QVector>

#include "keyfall/core/Errors.h"
#include "keyfall/state/NoteStateTracker.h"
#include "keyfall/timeline/Timeline.h"

namespace keyfall::predict {

struct PredictedNote {
    int index = -1; // timeline index
    timeline::TimelineEntry entry;
    double delaySeconds = 0.0; // from the cursor, wall-clock (tempo scale applied)
};

// One group of (near-)simultaneous upcoming note starts.
struct PredictionBatch {
    QVector<PredictedNote> notes;

    bool isEmpty() const { return notes.isEmpty(); }
    int size() const { return notes.size(); }
};

bool operator==(const PredictedNote& a, const PredictedNote& b);
bool operator==(const PredictionBatch& a, const PredictionBatch& b);

struct PredictionRequest {
    int cursorIndex = 0;
    double cursorSeconds = 0.0;          // song time
    double lookaheadWindowSeconds = 2.0; // wall-clock
    double tempoScalePercent = 100.0;
    double epsilonSeconds = 0.001;       // max spread inside one group
    int maxScanEntries = 4096;           // hard bound for sparse timelines
    state::HandSelection hands = state::HandSelection::Both;
    state::HandPolicy handPolicy;        // resolves channels for `hands`
};

// Stateless; predict() is deterministic for a fixed (request, timeline, snapshot).
class PredictionEngine {
public:
    static constexpr double kBaseWindowSeconds = 2.0;

    // Scans from the cursor and returns the first group of note starts that are
    // not already held, belong to the selected hand and fall inside the lookahead
    // window. The group ends at the first note event whose delay from the group's
    // first member exceeds epsilon.
    static PredictionBatch predict(const PredictionRequest& req,
                                   const timeline::Timeline& timeline,
                                   const state::NoteStateSnapshot& noteState);

    // base * (1 + skill/10) * (1 + difficulty/5). Negative inputs are rejected.
    static core::Outcome<double> calculateWindow(double skillLevel,
                                                 double songDifficulty,
                                                 double baseSeconds = kBaseWindowSeconds);
};

} // namespace keyfall::predict
