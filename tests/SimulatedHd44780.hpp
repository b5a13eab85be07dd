#ifndef HDLCD_TESTS_SIMULATED_HD44780_HPP
#define HDLCD_TESTS_SIMULATED_HD44780_HPP

#include "LcdFakes.hpp"

#include <stdint.h>
#include <string>
#include <vector>

namespace hdlcd {
namespace test {

// ─────────────────────────────────────────────────────────────────
// Behavioural model of the HD44780 write path, fed with EN strobes.
//
// Powers up in 8-bit mode. In 4-bit mode two strobes make one byte
// (high nibble first on D7..D4). Tracks DDRAM, CGRAM, the address
// counter and the write-only registers.
// ─────────────────────────────────────────────────────────────────
class SimulatedHd44780 : public StrobeListener {
public:
    struct Transfer {
        bool    rs;
        uint8_t value;
    };

    SimulatedHd44780()
        : eightBit(true), twoLine(false), font5x10(false)
        , displayOn(false), cursorOn(false), blinkOn(false)
        , increment(true), shiftOnWrite(false)
        , address(0), inCgram(false), displayShift(0)
        , m_haveHigh(false), m_high(0)
    {
        for (int i = 0; i < 128; ++i) ddram[i] = ' ';
        for (int i = 0; i < 64;  ++i) cgram[i] = 0;
    }

    // ── Register and memory state ──────────────────────────────
    bool    eightBit;
    bool    twoLine;
    bool    font5x10;
    bool    displayOn;
    bool    cursorOn;
    bool    blinkOn;
    bool    increment;
    bool    shiftOnWrite;
    uint8_t address;
    bool    inCgram;
    int     displayShift;
    uint8_t ddram[128];
    uint8_t cgram[64];

    std::vector<Transfer> transfers;     // every executed byte, in order

    std::string text(uint8_t from, uint8_t len) const
    {
        return std::string(reinterpret_cast<const char *>(&ddram[from]), len);
    }

    std::vector<uint8_t> instructions() const
    {
        std::vector<uint8_t> out;
        for (size_t i = 0; i < transfers.size(); ++i) {
            if (!transfers[i].rs) out.push_back(transfers[i].value);
        }
        return out;
    }

    void onStrobe(bool rs, uint8_t bus) override
    {
        if (eightBit) {
            execute(rs, bus);
            return;
        }

        if (!m_haveHigh) {
            m_high     = bus & 0xF0;
            m_haveHigh = true;
        } else {
            m_haveHigh = false;
            execute(rs, static_cast<uint8_t>(m_high | (bus >> 4)));
        }
    }

private:
    bool    m_haveHigh;
    uint8_t m_high;

    void execute(bool rs, uint8_t value)
    {
        Transfer t = { rs, value };
        transfers.push_back(t);

        if (rs) {
            writeData(value);
        } else {
            instruction(value);
        }
    }

    void instruction(uint8_t v)
    {
        if (v & 0x80) {                         // set DDRAM address
            address = v & 0x7F;
            inCgram = false;
        } else if (v & 0x40) {                  // set CGRAM address
            address = v & 0x3F;
            inCgram = true;
        } else if (v & 0x20) {                  // function set
            eightBit   = (v & 0x10) != 0;
            twoLine    = (v & 0x08) != 0;
            font5x10   = (v & 0x04) != 0;
            m_haveHigh = false;
        } else if (v & 0x10) {                  // cursor / display shift
            const bool right = (v & 0x04) != 0;
            if (v & 0x08) {
                displayShift += right ? 1 : -1;
            } else {
                step(right);
            }
        } else if (v & 0x08) {                  // display control
            displayOn = (v & 0x04) != 0;
            cursorOn  = (v & 0x02) != 0;
            blinkOn   = (v & 0x01) != 0;
        } else if (v & 0x04) {                  // entry mode
            increment    = (v & 0x02) != 0;
            shiftOnWrite = (v & 0x01) != 0;
        } else if (v & 0x02) {                  // return home
            address      = 0;
            inCgram      = false;
            displayShift = 0;
        } else if (v & 0x01) {                  // clear
            for (int i = 0; i < 128; ++i) ddram[i] = ' ';
            address      = 0;
            inCgram      = false;
            increment    = true;
            displayShift = 0;
        }
    }

    void writeData(uint8_t v)
    {
        if (inCgram) {
            cgram[address & 0x3F] = v;
            address = static_cast<uint8_t>((address + (increment ? 1 : -1)) & 0x3F);
            return;
        }

        ddram[address & 0x7F] = v;
        step(increment);
        if (shiftOnWrite) {
            displayShift += increment ? -1 : 1;
        }
    }

    /* DDRAM address counter, wrapping the way the chip does */
    void step(bool up)
    {
        if (twoLine) {
            if (up) {
                if      (address == 0x27) address = 0x40;
                else if (address == 0x67) address = 0x00;
                else                      ++address;
            } else {
                if      (address == 0x40) address = 0x27;
                else if (address == 0x00) address = 0x67;
                else                      --address;
            }
        } else {
            if (up) address = (address == 0x4F) ? 0x00 : static_cast<uint8_t>(address + 1);
            else    address = (address == 0x00) ? 0x4F : static_cast<uint8_t>(address - 1);
        }
    }
};

} // namespace test
} // namespace hdlcd

#endif /* HDLCD_TESTS_SIMULATED_HD44780_HPP */
