#pragma once

#include <QtGlobal>

#include "keyfall/core/Errors.h"
#include "keyfall/timing/TempoMap.h"

namespace keyfall::timing {

// Pure tick <-> seconds conversion. Safe to call from any thread.
//
// Seconds are "song seconds" (tempo scale 100%). applyTempoScale() maps them to
// wall-clock seconds for a user-selected playback speed.

// Single-tempo form: tick * microsPerBeat / (resolution * 1e6).
core::Outcome<double> ticksToSeconds(qint64 tick, int resolution, quint32 microsPerBeat);

// Uses the tempo in effect at each point of the map (the last change at or before
// the tick), integrating across earlier segments.
core::Outcome<double> ticksToSeconds(qint64 tick, const TempoMap& tempo);

// Inverse of ticksToSeconds() for the same map; exact up to floating-point rounding.
core::Outcome<double> secondsToTicks(double seconds, const TempoMap& tempo);

// seconds * 100 / scalePercent. scalePercent <= 0 is InvalidConfiguration.
core::Outcome<double> applyTempoScale(double seconds, double scalePercent);

// Inverse mapping (wall seconds back to song seconds): seconds * scalePercent / 100.
core::Outcome<double> removeTempoScale(double wallSeconds, double scalePercent);

} // namespace keyfall::timing
