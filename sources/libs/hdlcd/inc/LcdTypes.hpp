#ifndef HDLCD_LCD_TYPES_HPP
#define HDLCD_LCD_TYPES_HPP

#include <stdint.h>

namespace hdlcd {

// ── Bus / panel geometry ────────────────────────────────────────
enum class LineWidth : uint8_t { Four, Eight };     // data lines per transfer
enum class LineCount : uint8_t { One, Two, Four };  // visible rows
enum class FontSize  : uint8_t { FiveByEight, FiveByTen };

// ── Register flags ──────────────────────────────────────────────
enum class State           : uint8_t { Off, On };
enum class Direction       : uint8_t { LeftToRight, RightToLeft };
enum class ScrollDirection : uint8_t { Left, Right };

// RS level of a transfer
enum class LcdMode : uint8_t { Command, Data };

// ── Operation outcome ───────────────────────────────────────────
enum class LcdStatus : uint8_t {
    Ok,
    BusError,       // expander channel rejected a byte
    NotReady,       // last (re)initialisation did not complete
    BadPosition,    // row / column outside the configured geometry
    BadSlot,        // CGRAM slot outside the font's slot range
    BadConfig,      // builder options or wiring are unusable
    BadArgument,    // null buffer, wrong glyph size, format error
    Unsupported     // wiring has no line for the requested feature
};

struct CursorPosition {
    uint8_t row;
    uint8_t col;
};

inline bool operator==(const CursorPosition &a, const CursorPosition &b)
{
    return (a.row == b.row) && (a.col == b.col);
}

inline bool operator!=(const CursorPosition &a, const CursorPosition &b)
{
    return !(a == b);
}

inline bool isOn(State s) { return s == State::On; }

/** Printable name of a status, for diagnostics. */
const char *lcdStatusName(LcdStatus status);

} // namespace hdlcd

#endif /* HDLCD_LCD_TYPES_HPP */
