#ifndef HDLCD_EXPANDER_TRANSPORT_HPP
#define HDLCD_EXPANDER_TRANSPORT_HPP

#include "LcdTransport.hpp"

#include <stdint.h>

namespace hdlcd {

enum class BacklightPolarity : uint8_t { ActiveHigh, ActiveLow };

/*
 * Bit position of every LCD signal on the expander's 8 outputs.
 *
 * Standard PCF8574 backpack:
 *   P0 → RS   (Register Select)
 *   P1 → RW   (Read/Write, held LOW = write only)
 *   P2 → EN   (Enable strobe)
 *   P3 → BL   (Backlight, active HIGH)
 *   P4 → D4
 *   P5 → D5
 *   P6 → D6
 *   P7 → D7
 */
struct ExpanderWiring {
    uint8_t           rs;
    uint8_t           rw;
    uint8_t           enable;
    uint8_t           backlight;
    uint8_t           data[4];      // D4..D7
    BacklightPolarity polarity;
};

static const ExpanderWiring PCF8574_BACKPACK_WIRING = {
    0,                              // rs
    1,                              // rw
    2,                              // enable
    3,                              // backlight
    { 4, 5, 6, 7 },                 // D4..D7
    BacklightPolarity::ActiveHigh
};

// ─────────────────────────────────────────────────────────────────
// ExpanderTransport
//
// 4-bit framing through a serial I/O expander. Each nibble costs three
// byte writes (latch, EN high, EN low). When several displays share
// one channel, pass a BusLock: it is held for the whole strobe
// sequence of one send() and released before the settle wait.
//
// @p backlight is the BL level carried by every byte from the first
// write on, the presence probe included.
// ─────────────────────────────────────────────────────────────────
class ExpanderTransport : public LcdTransport {
public:
    ExpanderTransport(ExpanderChannel      &channel,
                      BusLock              *lock,
                      LcdDelay             &delay,
                      const LcdTiming      &timing = LCD_TIMING_DEFAULTS,
                      const ExpanderWiring &wiring = PCF8574_BACKPACK_WIRING,
                      State                 backlight = State::On);

    LineWidth lineWidth() const override { return LineWidth::Four; }

    LcdStatus reset() override;
    LcdStatus send(uint8_t value, LcdMode mode) override;
    LcdStatus sendInitNibble(uint8_t nibble) override;
    LcdStatus setBacklight(State state) override;

    /** Expander output byte for a nibble; exposed for diagnostics and tests. */
    uint8_t frame(uint8_t nibble, LcdMode mode, bool enable) const;

private:
    ExpanderChannel &m_channel;
    BusLock         *m_lock;
    ExpanderWiring   m_wiring;
    State            m_backlight;

    uint8_t backlightBits() const;
    bool    strobeNibble(uint8_t nibble, LcdMode mode);
};

} // namespace hdlcd

#endif /* HDLCD_EXPANDER_TRANSPORT_HPP */
