#include "keyfall/timing/TimeConverter.h"

namespace keyfall::timing {

using core::ErrorKind;
using core::Outcome;

namespace {
static Outcome<double> badResolution(int resolution) {
    return Outcome<double>::failure(ErrorKind::MalformedTimeline,
                                    QString("resolution must be > 0 (got %1)").arg(resolution));
}

static Outcome<double> badScale(double scalePercent) {
    return Outcome<double>::failure(ErrorKind::InvalidConfiguration,
                                    QString("tempo scale must be > 0 (got %1)").arg(scalePercent));
}
} // namespace

Outcome<double> ticksToSeconds(qint64 tick, int resolution, quint32 microsPerBeat) {
    if (resolution <= 0) return badResolution(resolution);
    const double t = double(qMax<qint64>(0, tick));
    return Outcome<double>::success(t * double(microsPerBeat) / (double(resolution) * 1000000.0));
}

Outcome<double> ticksToSeconds(qint64 tick, const TempoMap& tempo) {
    if (tempo.resolution() <= 0) return badResolution(tempo.resolution());
    const qint64 t = qMax<qint64>(0, tick);
    const TempoSegment& seg = tempo.segmentAt(t);
    const double deltaBeats = double(t - seg.startTick) / double(tempo.resolution());
    return Outcome<double>::success(seg.startSeconds + deltaBeats * (double(seg.microsPerBeat) * 1e-6));
}

Outcome<double> secondsToTicks(double seconds, const TempoMap& tempo) {
    if (tempo.resolution() <= 0) return badResolution(tempo.resolution());
    const double s = qMax(0.0, seconds);

    const TempoSegment* seg = &tempo.segments().front();
    for (const auto& candidate : tempo.segments()) {
        if (candidate.startSeconds <= s)
            seg = &candidate;
        else
            break;
    }
    const double beats = (s - seg->startSeconds) / (double(seg->microsPerBeat) * 1e-6);
    return Outcome<double>::success(double(seg->startTick) + beats * double(tempo.resolution()));
}

Outcome<double> applyTempoScale(double seconds, double scalePercent) {
    if (!(scalePercent > 0.0)) return badScale(scalePercent);
    return Outcome<double>::success(seconds * 100.0 / scalePercent);
}

Outcome<double> removeTempoScale(double wallSeconds, double scalePercent) {
    if (!(scalePercent > 0.0)) return badScale(scalePercent);
    return Outcome<double>::success(wallSeconds * scalePercent / 100.0);
}

} // namespace keyfall::timing
