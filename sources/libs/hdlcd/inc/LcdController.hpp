#ifndef HDLCD_LCD_CONTROLLER_HPP
#define HDLCD_LCD_CONTROLLER_HPP

#include "LcdConfig.hpp"
#include "LcdInstructions.hpp"
#include "LcdTransport.hpp"
#include "LcdTypes.hpp"

#include <stddef.h>
#include <stdint.h>
#include <memory>

namespace hdlcd {

class LcdBuilder;

// ─────────────────────────────────────────────────────────────────
// LcdController
//
// One initialised HD44780. Only LcdBuilder can create it, so every
// instance in the hands of the application has completed the power-on
// sequence. It owns its transport and the shadow copies of the three
// write-only registers; a shadow register only changes after the
// chip accepted the new value.
//
// Not thread safe: one task drives one controller.
// ─────────────────────────────────────────────────────────────────
class LcdController {
public:
    ~LcdController();

    LcdController(const LcdController &)            = delete;
    LcdController &operator=(const LcdController &) = delete;

    /** Blank the display and return the cursor to (0, 0). */
    LcdStatus clear();

    /** Return the cursor to (0, 0) and undo any display shift; DDRAM is kept. */
    LcdStatus home();

    /**
     * Move the cursor. Nothing is sent for an out-of-range position.
     * @param row  0 .. rows-1
     * @param col  0 .. columns-1
     */
    LcdStatus setCursor(uint8_t row, uint8_t col);

    /** Write one character code at the cursor; the chip advances the address. */
    LcdStatus write(uint8_t value);

    /** Write @p len bytes in order, stopping at the first failure. */
    LcdStatus print(const uint8_t *data, size_t len);

    /** Print a null-terminated string at the current cursor position. */
    LcdStatus print(const char *str);

    /** printf-style print; output past 80 characters is dropped. */
    LcdStatus printf(const char *fmt, ...);

    LcdStatus setDisplay(State state);
    LcdStatus setCursorVisible(State state);
    LcdStatus setBlink(State state);
    LcdStatus setDirection(Direction direction);
    LcdStatus setAutoscroll(State state);

    /**
     * Shift the whole display @p count positions. DDRAM content and the
     * tracked cursor position are not changed.
     */
    LcdStatus scroll(ScrollDirection direction, uint8_t count);

    /** Shift the cursor @p count positions without writing. */
    LcdStatus moveCursor(ScrollDirection direction, uint8_t count);

    /**
     * Program a CGRAM glyph. Afterwards the address counter points into
     * CGRAM: call setCursor(), home() or clear() before writing text.
     * @param slot   0 .. glyphSlots()-1
     * @param rows   pixel rows, bit 4 = leftmost column
     * @param count  must equal glyphRows()
     */
    LcdStatus createChar(uint8_t slot, const uint8_t *rows, uint8_t count);

    LcdStatus createChar(uint8_t slot, const uint8_t (&rows)[8])
    {
        return createChar(slot, rows, 8);
    }

    LcdStatus setBacklight(State state);

    /** Re-run the power-on sequence with the current register values. */
    LcdStatus reinitialise();

    // ── State ──────────────────────────────────────────────────
    bool           ready()          const { return m_ready; }
    LineWidth      lineWidth()      const { return m_function.width(); }
    LineCount      lineCount()      const { return m_function.lines(); }
    FontSize       fontSize()       const { return m_function.font();  }
    uint8_t        columns()        const { return m_columns; }
    uint8_t        rows()           const;
    State          display()        const { return m_control.display(); }
    State          cursorVisible()  const { return m_control.cursor();  }
    State          blink()          const { return m_control.blink();   }
    Direction      direction()      const { return m_entry.direction();  }
    State          autoscroll()     const { return m_entry.autoscroll(); }
    State          backlight()      const { return m_backlight; }
    CursorPosition cursorPosition() const { return m_cursor; }

    FunctionSet    functionSet()    const { return m_function; }
    DisplayControl displayControl() const { return m_control;  }
    EntryMode      entryMode()      const { return m_entry;    }

    uint8_t        glyphSlots()     const;
    uint8_t        glyphRows()      const;

    /** DDRAM address of (row, col); row and col must be in range. */
    uint8_t        ddramAddress(uint8_t row, uint8_t col) const;

private:
    friend class LcdBuilder;

    LcdController(std::unique_ptr<LcdTransport> transport,
                  const LcdConfig              &config);

    std::unique_ptr<LcdTransport> m_transport;
    uint8_t        m_columns;
    uint32_t       m_reliableInitUs;
    FunctionSet    m_function;
    DisplayControl m_control;
    EntryMode      m_entry;
    State          m_backlight;
    CursorPosition m_cursor;
    bool           m_ready;

    LcdStatus command(uint8_t value);
    LcdStatus applyDisplayControl(const DisplayControl &next);
    LcdStatus applyEntryMode(const EntryMode &next);
    LcdStatus repeat(uint8_t instruction, uint8_t count);
};

} // namespace hdlcd

#endif /* HDLCD_LCD_CONTROLLER_HPP */
