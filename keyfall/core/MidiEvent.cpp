#include "keyfall/core/MidiEvent.h"

namespace keyfall::core {

bool operator==(const RawEvent& a, const RawEvent& b) {
    return a.kind == b.kind && a.channel == b.channel && a.note == b.note && a.velocity == b.velocity
        && a.controller == b.controller && a.controlValue == b.controlValue && a.metaType == b.metaType
        && a.microsPerBeat == b.microsPerBeat && a.tickDelta == b.tickDelta && a.sourceTrack == b.sourceTrack;
}

} // namespace keyfall::core
