#ifndef HDLCD_LCD_TIMING_HPP
#define HDLCD_LCD_TIMING_HPP

#include "LcdTypes.hpp"

#include <stdint.h>

namespace hdlcd {

struct LcdTiming {
    uint32_t powerOnMs;      // Vcc rise to first instruction (> 40 ms)
    uint32_t resetFirstUs;   // after 1st 8-bit function set (> 4.1 ms)
    uint32_t resetSecondUs;  // after 2nd
    uint32_t resetThirdUs;   // after 3rd (> 100 us)
    uint32_t enablePulseUs;  // EN high time (> 450 ns)
    uint32_t shortExecUs;    // most instructions and data writes (37 us typ.)
    uint32_t longExecUs;     // clear / return home (1.52 ms typ.)
};

static const LcdTiming LCD_TIMING_DEFAULTS = {
    50,     // powerOnMs
    4500,   // resetFirstUs
    4500,   // resetSecondUs
    150,    // resetThirdUs
    1,      // enablePulseUs
    50,     // shortExecUs
    2000    // longExecUs
};

enum class ExecClass : uint8_t { Short, Long };

/** Execution class of a transfer: clear and return-home are Long, everything else Short. */
ExecClass execClass(uint8_t value, LcdMode mode);

/** Wait required after the transfer completes. */
uint32_t settleDelayUs(const LcdTiming &timing, uint8_t value, LcdMode mode);

} // namespace hdlcd

#endif /* HDLCD_LCD_TIMING_HPP */
