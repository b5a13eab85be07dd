#ifndef HDLCD_GPIO_PIN_HPP
#define HDLCD_GPIO_PIN_HPP

#include "LcdCapabilities.hpp"

#include <libopencm3/stm32/gpio.h>
#include <stdint.h>

namespace hdlcd {

struct GpioPin {
    uint32_t port;   // e.g. GPIOA, GPIOB ...
    uint16_t pin;    // e.g. GPIO0, GPIO1 ... (libopencm3 uses GPIO0 not GPIO_PIN_0)

    void setHigh() const { gpio_set(port, pin);   }
    void setLow()  const { gpio_clear(port, pin); }
};

// ─────────────────────────────────────────────────────────────────
// GpioOutputLine
//
// LCD signal on a push-pull GPIO. The port clock must already be
// enabled (rcc_periph_clock_enable) before setup() is called.
// ─────────────────────────────────────────────────────────────────
class GpioOutputLine : public OutputLine {
public:
    explicit GpioOutputLine(const GpioPin &pin)
        : m_pin(pin)
    {}

    /** Configure the pin as a low-speed push-pull output, driven LOW. */
    void setup();

    void set(bool high) override
    {
        if (high) m_pin.setHigh();
        else      m_pin.setLow();
    }

private:
    GpioPin m_pin;
};

} // namespace hdlcd

#endif /* HDLCD_GPIO_PIN_HPP */
