#include "LcdController.hpp"
#include "LcdBuilder.hpp"
#include "LcdLog.hpp"

#include <stdarg.h>
#include <stdio.h>
#include <utility>

namespace hdlcd {

/* 5x8: 8 glyphs of 8 rows; 5x10: 4 glyphs in 16-byte CGRAM blocks */
static const uint8_t GLYPH_SLOTS_5x8   = 8;
static const uint8_t GLYPH_SLOTS_5x10  = 4;
static const uint8_t GLYPH_ROWS_5x8    = 8;
static const uint8_t GLYPH_ROWS_5x10   = 10;
static const uint8_t GLYPH_STRIDE_5x10 = 16;

/* Longest string printf() will render: a full one-line 80-column panel */
static const size_t  PRINTF_BUFFER_LEN = LCD_MAX_COLUMNS_ONE_LINE + 1;

/* ── Construction ────────────────────────────────────────────────────────── */
LcdController::LcdController(std::unique_ptr<LcdTransport> transport,
                             const LcdConfig              &config)
    : m_transport(std::move(transport))
    , m_columns(config.columns)
    , m_reliableInitUs(config.reliableInitUs)
    , m_function(m_transport->lineWidth(), config.lines, config.font)
    , m_control(config.display, config.cursor, config.blink)
    , m_entry(config.direction, config.autoscroll)
    , m_backlight(config.backlight)
    , m_cursor()
    , m_ready(false)
{}

LcdController::~LcdController()
{}

/* ── Geometry ────────────────────────────────────────────────────────────── */
uint8_t LcdController::rows() const
{
    switch (m_function.lines()) {
        case LineCount::One:  return 1;
        case LineCount::Two:  return 2;
        case LineCount::Four: return 4;
    }
    return 1;
}

uint8_t LcdController::ddramAddress(uint8_t row, uint8_t col) const
{
    /* Rows 2 and 3 of a 4-line panel continue rows 0 and 1 */
    const uint8_t rowOffsets[] = {
        0x00,
        0x40,
        m_columns,
        static_cast<uint8_t>(0x40 + m_columns)
    };
    return static_cast<uint8_t>(rowOffsets[row & 0x03] + col);
}

uint8_t LcdController::glyphSlots() const
{
    return (m_function.font() == FontSize::FiveByTen) ? GLYPH_SLOTS_5x10 : GLYPH_SLOTS_5x8;
}

uint8_t LcdController::glyphRows() const
{
    return (m_function.font() == FontSize::FiveByTen) ? GLYPH_ROWS_5x10 : GLYPH_ROWS_5x8;
}

/* ── Low-level ───────────────────────────────────────────────────────────── */
LcdStatus LcdController::command(uint8_t value)
{
    if (!m_ready) {
        return LcdStatus::NotReady;
    }
    return m_transport->send(value, LcdMode::Command);
}

LcdStatus LcdController::applyDisplayControl(const DisplayControl &next)
{
    const LcdStatus st = command(next.instruction());
    if (st == LcdStatus::Ok) {
        m_control = next;
    }
    return st;
}

LcdStatus LcdController::applyEntryMode(const EntryMode &next)
{
    const LcdStatus st = command(next.instruction());
    if (st == LcdStatus::Ok) {
        m_entry = next;
    }
    return st;
}

LcdStatus LcdController::repeat(uint8_t instruction, uint8_t count)
{
    if (!m_ready) {
        return LcdStatus::NotReady;
    }

    for (uint8_t i = 0; i < count; ++i) {
        const LcdStatus st = command(instruction);
        if (st != LcdStatus::Ok) {
            return st;
        }
    }
    return LcdStatus::Ok;
}

/* ── Public API ──────────────────────────────────────────────────────────── */

LcdStatus LcdController::clear()
{
    const LcdStatus st = command(HD_CLEARDISPLAY);
    if (st != LcdStatus::Ok) {
        return st;
    }
    m_cursor = CursorPosition();

    /* Clear also sets I/D; put a right-to-left entry mode back */
    if (m_entry.direction() == Direction::RightToLeft) {
        const LcdStatus restored = command(m_entry.instruction());
        if (restored != LcdStatus::Ok) {
            m_entry = m_entry.withDirection(Direction::LeftToRight);
        }
        return restored;
    }
    return LcdStatus::Ok;
}

LcdStatus LcdController::home()
{
    const LcdStatus st = command(HD_RETURNHOME);
    if (st == LcdStatus::Ok) {
        m_cursor = CursorPosition();
    }
    return st;
}

LcdStatus LcdController::setCursor(uint8_t row, uint8_t col)
{
    if (!m_ready) {
        return LcdStatus::NotReady;
    }

    if ((row >= rows()) || (col >= m_columns)) {
        HDLCD_LOG("LCD: setCursor(%u, %u) outside %ux%u\n",
                  static_cast<unsigned>(row), static_cast<unsigned>(col),
                  static_cast<unsigned>(rows()), static_cast<unsigned>(m_columns));
        return LcdStatus::BadPosition;
    }

    const LcdStatus st = command(ddramAddressInstruction(ddramAddress(row, col)));
    if (st == LcdStatus::Ok) {
        m_cursor.row = row;
        m_cursor.col = col;
    }
    return st;
}

LcdStatus LcdController::write(uint8_t value)
{
    if (!m_ready) {
        return LcdStatus::NotReady;
    }
    return m_transport->send(value, LcdMode::Data);
}

LcdStatus LcdController::print(const uint8_t *data, size_t len)
{
    if ((data == nullptr) && (len > 0)) {
        return LcdStatus::BadArgument;
    }

    for (size_t i = 0; i < len; ++i) {
        const LcdStatus st = write(data[i]);
        if (st != LcdStatus::Ok) {
            return st;
        }
    }
    return m_ready ? LcdStatus::Ok : LcdStatus::NotReady;
}

LcdStatus LcdController::print(const char *str)
{
    if (str == nullptr) {
        return LcdStatus::BadArgument;
    }

    while (*str) {
        const LcdStatus st = write(static_cast<uint8_t>(*str++));
        if (st != LcdStatus::Ok) {
            return st;
        }
    }
    return m_ready ? LcdStatus::Ok : LcdStatus::NotReady;
}

LcdStatus LcdController::printf(const char *fmt, ...)
{
    if (fmt == nullptr) {
        return LcdStatus::BadArgument;
    }

    char buffer[PRINTF_BUFFER_LEN];

    va_list args;
    va_start(args, fmt);
    const int n = vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    if (n < 0) {
        return LcdStatus::BadArgument;
    }
    return print(buffer);
}

LcdStatus LcdController::setDisplay(State state)
{
    return applyDisplayControl(m_control.withDisplay(state));
}

LcdStatus LcdController::setCursorVisible(State state)
{
    return applyDisplayControl(m_control.withCursor(state));
}

LcdStatus LcdController::setBlink(State state)
{
    return applyDisplayControl(m_control.withBlink(state));
}

LcdStatus LcdController::setDirection(Direction direction)
{
    return applyEntryMode(m_entry.withDirection(direction));
}

LcdStatus LcdController::setAutoscroll(State state)
{
    return applyEntryMode(m_entry.withAutoscroll(state));
}

LcdStatus LcdController::scroll(ScrollDirection direction, uint8_t count)
{
    return repeat(displayShiftInstruction(direction), count);
}

LcdStatus LcdController::moveCursor(ScrollDirection direction, uint8_t count)
{
    return repeat(cursorShiftInstruction(direction), count);
}

LcdStatus LcdController::createChar(uint8_t slot, const uint8_t *rows, uint8_t count)
{
    if (!m_ready) {
        return LcdStatus::NotReady;
    }

    if (slot >= glyphSlots()) {
        HDLCD_LOG("LCD: glyph slot %u outside 0..%u\n",
                  static_cast<unsigned>(slot), static_cast<unsigned>(glyphSlots() - 1));
        return LcdStatus::BadSlot;
    }
    if ((rows == nullptr) || (count != glyphRows())) {
        return LcdStatus::BadArgument;
    }

    const uint8_t stride = (m_function.font() == FontSize::FiveByTen) ? GLYPH_STRIDE_5x10
                                                                       : GLYPH_ROWS_5x8;
    LcdStatus st = command(cgramAddressInstruction(static_cast<uint8_t>(slot * stride)));

    for (uint8_t i = 0; (st == LcdStatus::Ok) && (i < count); ++i) {
        st = write(rows[i]);
    }
    return st;
}

LcdStatus LcdController::setBacklight(State state)
{
    if (!m_ready) {
        return LcdStatus::NotReady;
    }

    const LcdStatus st = m_transport->setBacklight(state);
    if (st == LcdStatus::Ok) {
        m_backlight = state;
    }
    return st;
}

LcdStatus LcdController::reinitialise()
{
    return LcdBuilder::initialise(*this);
}

} // namespace hdlcd
