#include "LcdTiming.hpp"
#include "LcdInstructions.hpp"

namespace hdlcd {

ExecClass execClass(uint8_t value, LcdMode mode)
{
    if (mode == LcdMode::Data) {
        return ExecClass::Short;
    }

    /* 0x01 clear, 0x02 / 0x03 return home (bit 0 is don't-care) */
    if ((value == HD_CLEARDISPLAY) || ((value & 0xFE) == HD_RETURNHOME)) {
        return ExecClass::Long;
    }

    return ExecClass::Short;
}

uint32_t settleDelayUs(const LcdTiming &timing, uint8_t value, LcdMode mode)
{
    return (execClass(value, mode) == ExecClass::Long) ? timing.longExecUs
                                                       : timing.shortExecUs;
}

} // namespace hdlcd
