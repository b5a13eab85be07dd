#ifndef HDLCD_LCD_CONFIG_HPP
#define HDLCD_LCD_CONFIG_HPP

#include "LcdTiming.hpp"
#include "LcdTypes.hpp"

#include <stdint.h>

namespace hdlcd {

struct LcdConfig {
    LineCount lines;            // panel rows
    FontSize  font;             // 5x10 only honoured on one-line panels
    uint8_t   columns;          // visible characters per row (e.g. 16, 20)
    State     display;
    State     cursor;           // underline cursor
    State     blink;            // blinking block cursor
    Direction direction;        // address counter increment / decrement
    State     autoscroll;       // shift display on every write
    State     backlight;
    LcdTiming timing;
    uint32_t  reliableInitUs;   // > 0: extra display off/on cycles after init
};

static const LcdConfig LCD_CONFIG_DEFAULTS = {
    LineCount::One,
    FontSize::FiveByEight,
    16,                         // columns
    State::On,                  // display
    State::Off,                 // cursor
    State::Off,                 // blink
    Direction::LeftToRight,
    State::Off,                 // autoscroll
    State::On,                  // backlight
    LCD_TIMING_DEFAULTS,
    0                           // reliableInitUs
};

/* Widest row the DDRAM windows allow for a given line count */
constexpr uint8_t LCD_MAX_COLUMNS_ONE_LINE  = 80;
constexpr uint8_t LCD_MAX_COLUMNS_TWO_LINES = 40;
constexpr uint8_t LCD_MAX_COLUMNS_FOUR_LINE = 20;

} // namespace hdlcd

#endif /* HDLCD_LCD_CONFIG_HPP */
