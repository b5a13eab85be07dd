#ifndef HDLCD_OPENCM3_I2C_HPP
#define HDLCD_OPENCM3_I2C_HPP

#include "LcdCapabilities.hpp"

#include <stdint.h>

namespace hdlcd {

/*
 * I2C1 master, standard mode 100 kHz, polled.
 *
 *   PB6 → SCL
 *   PB7 → SDA
 *   (Requires 4.7kΩ pull-up resistors to 3.3V on both lines)
 *
 * One bus object serves every expander wired to I2C1; guard it with a
 * FreeRtosBusLock when more than one task talks to it.
 */
class Opencm3I2cBus {
public:
    /** @param apb1Mhz  APB1 clock in MHz (36 on a 72 MHz F103, 42 on an 84 MHz F411) */
    explicit Opencm3I2cBus(uint8_t apb1Mhz = 36)
        : m_apb1Mhz(apb1Mhz)
    {}

    /** Clock, pins and peripheral setup. Call once before the scheduler starts. */
    void setup();

    /**
     * START, address + W, one data byte, STOP.
     * @return false on NACK (address or data) or when the bus hangs
     */
    bool writeByte(uint8_t address, uint8_t data);

private:
    uint8_t m_apb1Mhz;

    bool waitStatus(uint32_t sr1Mask);
    bool waitIdle();
};

/* PCF8574 default address 0x27 (A2=A1=A0=1), PCF8574A 0x3F */
static const uint8_t PCF8574_DEFAULT_ADDRESS  = 0x27;
static const uint8_t PCF8574A_DEFAULT_ADDRESS = 0x3F;

/** One expander at a fixed address on an Opencm3I2cBus. */
class Opencm3ExpanderChannel : public ExpanderChannel {
public:
    Opencm3ExpanderChannel(Opencm3I2cBus &bus, uint8_t address = PCF8574_DEFAULT_ADDRESS)
        : m_bus(bus)
        , m_address(address)
    {}

    bool write(uint8_t value) override
    {
        return m_bus.writeByte(m_address, value);
    }

private:
    Opencm3I2cBus &m_bus;
    uint8_t        m_address;
};

} // namespace hdlcd

#endif /* HDLCD_OPENCM3_I2C_HPP */
