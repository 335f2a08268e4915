#pragma once

#include <QByteArray>
#include <QString>

#include "keyfall/core/Errors.h"
#include "keyfall/core/MidiEvent.h"

namespace keyfall::input {

// Standard MIDI File (format 0/1) -> per-track relative-delta events.
//
// Keeps Note On/Off, Control Change, tempo (FF 51) and end-of-track; skips other
// meta, SysEx and the one-byte channel messages. Running status is honoured.
// SMPTE division is not supported for timing and falls back to 480 ticks/beat.
// Data bytes above 127 are clipped. Any structural problem is MalformedTimeline.
core::Outcome<core::SourceTracks> readSmf(const QByteArray& bytes);
core::Outcome<core::SourceTracks> readSmfFile(const QString& path);

// Rewrites the channel of every note event to (trackIndex + offset), offset 1 when
// the file has exactly two tracks (the usual tempo track + one part per hand
// layout puts the hands on channels 1 and 2).
void assignChannelsByTrack(core::SourceTracks& source);

} // namespace keyfall::input
