#ifndef HDLCD_LCD_TRANSPORT_HPP
#define HDLCD_LCD_TRANSPORT_HPP

#include "LcdCapabilities.hpp"
#include "LcdTiming.hpp"
#include "LcdTypes.hpp"

#include <stdint.h>

namespace hdlcd {

// ─────────────────────────────────────────────────────────────────
// LcdTransport
//
// Moves one byte to the controller in command or data mode and waits
// out its execution time before returning. The controller only ever
// talks to this interface; ParallelTransport and ExpanderTransport
// are the two wirings, tests plug in a recording fake.
// ─────────────────────────────────────────────────────────────────
class LcdTransport {
public:
    virtual ~LcdTransport() {}

    LcdTransport(const LcdTransport &)            = delete;
    LcdTransport &operator=(const LcdTransport &) = delete;

    /** Data lines used per transfer; fixed for the transport's lifetime. */
    virtual LineWidth lineWidth() const = 0;

    /** Drive every line to its idle level. On an expander this also probes the device. */
    virtual LcdStatus reset() = 0;

    /**
     * Send a full byte.
     * @param value  instruction or character code
     * @param mode   Command (RS low) or Data (RS high)
     */
    virtual LcdStatus send(uint8_t value, LcdMode mode) = 0;

    /**
     * Single enable pulse carrying only the upper four data bits, in
     * command mode. Used by the power-on sequence before the chip has
     * switched to 4-bit framing.
     * @param nibble  value for D7..D4 in its low four bits
     */
    virtual LcdStatus sendInitNibble(uint8_t nibble) = 0;

    virtual LcdStatus setBacklight(State state) = 0;

    LcdDelay        &delay()        { return m_delay;  }
    const LcdTiming &timing() const { return m_timing; }

protected:
    LcdTransport(LcdDelay &delay, const LcdTiming &timing)
        : m_delay(delay)
        , m_timing(timing)
    {}

    LcdDelay  &m_delay;
    LcdTiming  m_timing;
};

} // namespace hdlcd

#endif /* HDLCD_LCD_TRANSPORT_HPP */
