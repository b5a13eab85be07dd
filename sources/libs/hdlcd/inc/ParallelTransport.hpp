#ifndef HDLCD_PARALLEL_TRANSPORT_HPP
#define HDLCD_PARALLEL_TRANSPORT_HPP

#include "LcdTransport.hpp"

#include <stdint.h>

namespace hdlcd {

/*
 * Direct GPIO wiring of an HD44780:
 *
 *   RS  → register select (0 = instruction, 1 = data)
 *   RW  → optional, held LOW (write only)
 *   EN  → enable strobe, data latched on the falling edge
 *   D0..D7 (8-bit) or D4..D7 (4-bit, D0..D3 left unconnected)
 *   BL  → optional backlight switch, active HIGH
 */
struct ParallelWiring {
    OutputLine *rs;
    OutputLine *enable;
    OutputLine *rw;
    OutputLine *backlight;
    OutputLine *data[8];     // index = Dn
    LineWidth   width;

    static ParallelWiring fourBit(OutputLine &rs, OutputLine &enable,
                                  OutputLine &d4, OutputLine &d5,
                                  OutputLine &d6, OutputLine &d7);

    static ParallelWiring eightBit(OutputLine &rs, OutputLine &enable,
                                   OutputLine &d0, OutputLine &d1,
                                   OutputLine &d2, OutputLine &d3,
                                   OutputLine &d4, OutputLine &d5,
                                   OutputLine &d6, OutputLine &d7);

    ParallelWiring &withReadWrite(OutputLine &line) { rw = &line;        return *this; }
    ParallelWiring &withBacklight(OutputLine &line) { backlight = &line; return *this; }

    /** True when RS, EN and every data line the width needs are present. */
    bool complete() const;
};

class ParallelTransport : public LcdTransport {
public:
    /** @p wiring must be complete(); the lines are borrowed, not owned. */
    ParallelTransport(const ParallelWiring &wiring,
                      LcdDelay             &delay,
                      const LcdTiming      &timing = LCD_TIMING_DEFAULTS);

    LineWidth lineWidth() const override { return m_wiring.width; }

    LcdStatus reset() override;
    LcdStatus send(uint8_t value, LcdMode mode) override;
    LcdStatus sendInitNibble(uint8_t nibble) override;
    LcdStatus setBacklight(State state) override;

private:
    ParallelWiring m_wiring;

    void putHighLines(uint8_t nibble);      // D4..D7
    void putAllLines(uint8_t value);        // D0..D7
    void pulseEnable(uint32_t settleUs);
};

} // namespace hdlcd

#endif /* HDLCD_PARALLEL_TRANSPORT_HPP */
