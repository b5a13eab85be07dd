#include "LcdBuilder.hpp"
#include "LcdInstructions.hpp"
#include "LcdLog.hpp"

#include <utility>

namespace hdlcd {

/* Reliable-init: number of display off/on cycles after the standard sequence */
static const uint8_t RELIABLE_INIT_CYCLES = 3;

/* ── Option checks ───────────────────────────────────────────────────────── */
LcdStatus LcdBuilder::resolve(LcdConfig &resolved) const
{
    resolved = m_config;

    uint8_t maxColumns = LCD_MAX_COLUMNS_ONE_LINE;
    if (resolved.lines == LineCount::Two)  maxColumns = LCD_MAX_COLUMNS_TWO_LINES;
    if (resolved.lines == LineCount::Four) maxColumns = LCD_MAX_COLUMNS_FOUR_LINE;

    if ((resolved.columns == 0) || (resolved.columns > maxColumns)) {
        HDLCD_LOG("LCD: %u columns not possible (max %u)\n",
                  static_cast<unsigned>(resolved.columns), static_cast<unsigned>(maxColumns));
        return LcdStatus::BadConfig;
    }

    /* The chip ignores F in two-line mode: 5x10 is a one-line font */
    if ((resolved.font == FontSize::FiveByTen) && (resolved.lines != LineCount::One)) {
        HDLCD_LOG("LCD: 5x10 font needs one line, using 5x8\n");
        resolved.font = FontSize::FiveByEight;
    }

    return LcdStatus::Ok;
}

/* ── Entry points ────────────────────────────────────────────────────────── */
LcdStatus LcdBuilder::buildParallel(const ParallelWiring           &wiring,
                                    LcdDelay                       &delay,
                                    std::unique_ptr<LcdController> &out) const
{
    if (!wiring.complete()) {
        HDLCD_LOG("LCD: parallel wiring incomplete\n");
        return LcdStatus::BadConfig;
    }

    std::unique_ptr<LcdTransport> transport(
        new ParallelTransport(wiring, delay, m_config.timing));
    return build(std::move(transport), out);
}

LcdStatus LcdBuilder::buildExpander(ExpanderChannel                &channel,
                                    BusLock                        *lock,
                                    LcdDelay                       &delay,
                                    std::unique_ptr<LcdController> &out,
                                    const ExpanderWiring           &wiring) const
{
    std::unique_ptr<LcdTransport> transport(
        new ExpanderTransport(channel, lock, delay, m_config.timing, wiring,
                              m_config.backlight));
    return build(std::move(transport), out);
}

LcdStatus LcdBuilder::build(std::unique_ptr<LcdTransport>   transport,
                            std::unique_ptr<LcdController> &out) const
{
    if (!transport) {
        return LcdStatus::BadArgument;
    }

    LcdConfig resolved;
    LcdStatus st = resolve(resolved);
    if (st != LcdStatus::Ok) {
        return st;
    }

    std::unique_ptr<LcdController> lcd(new LcdController(std::move(transport), resolved));

    st = initialise(*lcd);
    if (st != LcdStatus::Ok) {
        return st;
    }

    out = std::move(lcd);
    return LcdStatus::Ok;
}

// ─────────────────────────────────────────────────────────────────
// HD44780 power-on initialisation (datasheet figures 23 / 24)
//
// The chip may wake up in 8-bit mode or half way through a 4-bit
// transfer. Three 8-bit "function set" pulses bring it to a known
// 8-bit state; in 4-bit wiring a fourth pulse (0x2) switches it to
// 4-bit framing before the real function set goes out.
// ─────────────────────────────────────────────────────────────────
LcdStatus LcdBuilder::initialise(LcdController &lcd)
{
    LcdTransport    &bus    = *lcd.m_transport;
    LcdDelay        &delay  = bus.delay();
    const LcdTiming &timing = bus.timing();

    lcd.m_ready = false;

    HDLCD_LOG("LCD: init %s-bit, %u rows x %u cols\n",
              (bus.lineWidth() == LineWidth::Eight) ? "8" : "4",
              static_cast<unsigned>(lcd.rows()), static_cast<unsigned>(lcd.columns()));

    delay.waitMs(timing.powerOnMs);             /* wait >40ms after Vcc rises */

    LcdStatus st = bus.reset();
    if (st != LcdStatus::Ok) {
        return st;
    }

    /* Three-step reset to guarantee 8-bit mode regardless of prior state */
    const uint32_t resetWaitUs[] = {
        timing.resetFirstUs,
        timing.resetSecondUs,
        timing.resetThirdUs
    };
    for (uint8_t i = 0; i < 3; ++i) {
        st = bus.sendInitNibble((HD_FUNCTIONSET | HD_8BITMODE) >> 4);
        if (st != LcdStatus::Ok) {
            return st;
        }
        delay.waitUs(resetWaitUs[i]);
    }

    /* Switch to 4-bit mode */
    if (bus.lineWidth() == LineWidth::Four) {
        st = bus.sendInitNibble(HD_FUNCTIONSET >> 4);
        if (st != LcdStatus::Ok) {
            return st;
        }
    }

    const uint8_t sequence[] = {
        lcd.m_function.instruction(),           /* lines + font, final width */
        lcd.m_control.instruction(),
        HD_CLEARDISPLAY,
        lcd.m_entry.instruction()
    };
    for (uint8_t i = 0; i < sizeof(sequence); ++i) {
        st = bus.send(sequence[i], LcdMode::Command);
        if (st != LcdStatus::Ok) {
            HDLCD_LOG("LCD: init FAIL (%s)\n", lcdStatusName(st));
            return st;
        }
    }

    /* Some modules only come up after a few display off/on cycles */
    if (lcd.m_reliableInitUs > 0) {
        const uint8_t off = lcd.m_control.withDisplay(State::Off).instruction();
        const uint8_t on  = lcd.m_control.instruction();

        for (uint8_t i = 0; i < RELIABLE_INIT_CYCLES; ++i) {
            st = bus.send(off, LcdMode::Command);
            if (st == LcdStatus::Ok) {
                delay.waitUs(lcd.m_reliableInitUs);
                st = bus.send(on, LcdMode::Command);
            }
            if (st != LcdStatus::Ok) {
                return st;
            }
            delay.waitUs(lcd.m_reliableInitUs);
        }
    }

    /* Wiring without a backlight line is not an error here */
    st = bus.setBacklight(lcd.m_backlight);
    if ((st != LcdStatus::Ok) && (st != LcdStatus::Unsupported)) {
        return st;
    }

    lcd.m_cursor = CursorPosition();
    lcd.m_ready  = true;

    HDLCD_LOG("LCD: init OK\n");
    return LcdStatus::Ok;
}

} // namespace hdlcd
