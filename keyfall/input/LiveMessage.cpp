#include "keyfall/input/LiveMessage.h"

namespace keyfall::input {

bool decodeChannelMessage(const unsigned char* bytes, std::size_t size, core::RawEvent& out) {
    if (!bytes || size < 3) return false;
    const unsigned char status = bytes[0];
    const int channel = status & 0x0F;
    const int d1 = bytes[1] & 0x7F;
    const int d2 = bytes[2] & 0x7F;

    switch (status & 0xF0) {
    case 0x90:
        out = core::RawEvent::noteOn(channel, d1, d2);
        break;
    case 0x80:
        out = core::RawEvent::noteOff(channel, d1);
        break;
    case 0xB0:
        out = core::RawEvent::controlChange(channel, d1, d2);
        break;
    default:
        return false;
    }
    out.sourceTrack = -1;
    return true;
}

} // namespace keyfall::input
