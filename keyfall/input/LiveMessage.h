#pragma once

#include <cstddef>

#include "keyfall/core/MidiEvent.h"

namespace keyfall::input {

// Decodes one short channel message as delivered by a MIDI input callback.
// Note On, Note Off and Control Change are kept; everything else (clock, active
// sensing, pitch bend, sysex...) returns false.
bool decodeChannelMessage(const unsigned char* bytes, std::size_t size, core::RawEvent& out);

} // namespace keyfall::input
