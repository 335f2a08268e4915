#include "keyfall/predict/PredictionEngine.h"

namespace keyfall::predict {

using core::ErrorKind;
using core::Outcome;

bool operator==(const PredictedNote& a, const PredictedNote& b) {
    return a.index == b.index && a.entry == b.entry && qAbs(a.delaySeconds - b.delaySeconds) < 1e-12;
}

bool operator==(const PredictionBatch& a, const PredictionBatch& b) {
    return a.notes == b.notes;
}

PredictionBatch PredictionEngine::predict(const PredictionRequest& req,
                                          const timeline::Timeline& timeline,
                                          const state::NoteStateSnapshot& noteState) {
    PredictionBatch batch;
    if (req.cursorIndex < 0 || req.cursorIndex >= timeline.size()) return batch;
    if (!(req.tempoScalePercent > 0.0)) return batch;

    const double scale = 100.0 / req.tempoScalePercent;
    const double eps = qMax(0.0, req.epsilonSeconds);
    const int end = qMin(timeline.size(), req.cursorIndex + qMax(1, req.maxScanEntries));
    double anchorSeconds = 0.0;

    for (int i = req.cursorIndex; i < end; ++i) {
        const auto& e = timeline.at(i);
        const double fromCursor = qMax(0.0, (e.absoluteSeconds - req.cursorSeconds) * scale);
        if (fromCursor > req.lookaheadWindowSeconds) break; // entries are time-ordered

        const bool selected = req.handPolicy.selects(req.hands, e.event.channel);
        if (!batch.isEmpty() && e.event.isNote() && selected) {
            const double fromAnchor = (e.absoluteSeconds - anchorSeconds) * scale;
            if (fromAnchor > eps) break;
        }

        if (!e.event.isNoteStart() || !selected) continue;
        if (noteState.isActive(e.event.channel, e.event.note)) continue;

        if (batch.isEmpty()) anchorSeconds = e.absoluteSeconds;
        batch.notes.push_back(PredictedNote{i, e, fromCursor});
    }
    return batch;
}

Outcome<double> PredictionEngine::calculateWindow(double skillLevel, double songDifficulty, double baseSeconds) {
    if (skillLevel < 0.0 || songDifficulty < 0.0) {
        return Outcome<double>::failure(ErrorKind::InvalidConfiguration,
                                        QString("skill level and song difficulty must be >= 0 (got %1, %2)")
                                            .arg(skillLevel)
                                            .arg(songDifficulty));
    }
    if (!(baseSeconds > 0.0)) {
        return Outcome<double>::failure(ErrorKind::InvalidConfiguration,
                                        QString("lookahead base must be > 0 (got %1)").arg(baseSeconds));
    }
    return Outcome<double>::success(baseSeconds * (1.0 + skillLevel / 10.0) * (1.0 + songDifficulty / 5.0));
}

} // namespace keyfall::predict
