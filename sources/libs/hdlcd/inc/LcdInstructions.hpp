#ifndef HDLCD_LCD_INSTRUCTIONS_HPP
#define HDLCD_LCD_INSTRUCTIONS_HPP

#include "LcdTypes.hpp"

#include <stdint.h>

namespace hdlcd {

/* ── HD44780 instruction set ─────────────────────────────────────────────── */
constexpr uint8_t HD_CLEARDISPLAY   = 0x01;
constexpr uint8_t HD_RETURNHOME     = 0x02;
constexpr uint8_t HD_ENTRYMODESET   = 0x04;
constexpr uint8_t HD_DISPLAYCONTROL = 0x08;
constexpr uint8_t HD_CURSORSHIFT    = 0x10;
constexpr uint8_t HD_FUNCTIONSET    = 0x20;
constexpr uint8_t HD_SETCGRAMADDR   = 0x40;
constexpr uint8_t HD_SETDDRAMADDR   = 0x80;

/* Entry mode flags */
constexpr uint8_t HD_ENTRY_LEFT     = 0x02;   // I/D: increment
constexpr uint8_t HD_ENTRY_SHIFT    = 0x01;   // S: shift display on write

/* Display control flags */
constexpr uint8_t HD_DISPLAY_ON     = 0x04;
constexpr uint8_t HD_CURSOR_ON      = 0x02;
constexpr uint8_t HD_BLINK_ON       = 0x01;

/* Cursor / display shift flags */
constexpr uint8_t HD_DISPLAYMOVE    = 0x08;   // S/C: 1 = display, 0 = cursor
constexpr uint8_t HD_MOVERIGHT      = 0x04;   // R/L

/* Function set flags */
constexpr uint8_t HD_8BITMODE       = 0x10;
constexpr uint8_t HD_2LINE          = 0x08;
constexpr uint8_t HD_5x10DOTS       = 0x04;

/* Address masks */
constexpr uint8_t HD_CGRAM_MASK     = 0x3F;
constexpr uint8_t HD_DDRAM_MASK     = 0x7F;

// ─────────────────────────────────────────────────────────────────
// Shadow registers
//
// The chip cannot be read back, so the driver keeps a copy of the
// three write-only registers. Every change produces a new value and
// the whole register is re-sent; there is no partial update.
// ─────────────────────────────────────────────────────────────────

class FunctionSet {
public:
    FunctionSet(LineWidth width, LineCount lines, FontSize font)
        : m_width(width), m_lines(lines), m_font(font)
    {}

    LineWidth width() const { return m_width; }
    LineCount lines() const { return m_lines; }
    FontSize  font()  const { return m_font;  }

    uint8_t instruction() const
    {
        uint8_t v = HD_FUNCTIONSET;
        if (m_width == LineWidth::Eight)     v |= HD_8BITMODE;
        if (m_lines != LineCount::One)       v |= HD_2LINE;     // 4-row panels run in 2-line mode
        if (m_font  == FontSize::FiveByTen)  v |= HD_5x10DOTS;
        return v;
    }

    bool operator==(const FunctionSet &o) const
    {
        return (m_width == o.m_width) && (m_lines == o.m_lines) && (m_font == o.m_font);
    }

private:
    LineWidth m_width;
    LineCount m_lines;
    FontSize  m_font;
};

class DisplayControl {
public:
    DisplayControl(State display, State cursor, State blink)
        : m_display(display), m_cursor(cursor), m_blink(blink)
    {}

    State display() const { return m_display; }
    State cursor()  const { return m_cursor;  }
    State blink()   const { return m_blink;   }

    DisplayControl withDisplay(State s) const { return DisplayControl(s, m_cursor, m_blink);   }
    DisplayControl withCursor(State s)  const { return DisplayControl(m_display, s, m_blink);  }
    DisplayControl withBlink(State s)   const { return DisplayControl(m_display, m_cursor, s); }

    uint8_t instruction() const
    {
        uint8_t v = HD_DISPLAYCONTROL;
        if (isOn(m_display)) v |= HD_DISPLAY_ON;
        if (isOn(m_cursor))  v |= HD_CURSOR_ON;
        if (isOn(m_blink))   v |= HD_BLINK_ON;
        return v;
    }

    bool operator==(const DisplayControl &o) const
    {
        return (m_display == o.m_display) && (m_cursor == o.m_cursor) && (m_blink == o.m_blink);
    }

private:
    State m_display;
    State m_cursor;
    State m_blink;
};

class EntryMode {
public:
    EntryMode(Direction direction, State autoscroll)
        : m_direction(direction), m_autoscroll(autoscroll)
    {}

    Direction direction()  const { return m_direction;  }
    State     autoscroll() const { return m_autoscroll; }

    EntryMode withDirection(Direction d) const { return EntryMode(d, m_autoscroll); }
    EntryMode withAutoscroll(State s)    const { return EntryMode(m_direction, s);  }

    uint8_t instruction() const
    {
        uint8_t v = HD_ENTRYMODESET;
        if (m_direction == Direction::LeftToRight) v |= HD_ENTRY_LEFT;
        if (isOn(m_autoscroll))                    v |= HD_ENTRY_SHIFT;
        return v;
    }

    bool operator==(const EntryMode &o) const
    {
        return (m_direction == o.m_direction) && (m_autoscroll == o.m_autoscroll);
    }

private:
    Direction m_direction;
    State     m_autoscroll;
};

/* ── Stateless instructions ──────────────────────────────────────────────── */

inline uint8_t ddramAddressInstruction(uint8_t address)
{
    return HD_SETDDRAMADDR | (address & HD_DDRAM_MASK);
}

inline uint8_t cgramAddressInstruction(uint8_t address)
{
    return HD_SETCGRAMADDR | (address & HD_CGRAM_MASK);
}

inline uint8_t displayShiftInstruction(ScrollDirection dir)
{
    return HD_CURSORSHIFT | HD_DISPLAYMOVE
         | ((dir == ScrollDirection::Right) ? HD_MOVERIGHT : 0);
}

inline uint8_t cursorShiftInstruction(ScrollDirection dir)
{
    return HD_CURSORSHIFT
         | ((dir == ScrollDirection::Right) ? HD_MOVERIGHT : 0);
}

} // namespace hdlcd

#endif /* HDLCD_LCD_INSTRUCTIONS_HPP */
