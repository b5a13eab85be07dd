#include "GpioPin.hpp"

namespace hdlcd {

void GpioOutputLine::setup()
{
    m_pin.setLow();

#if defined(STM32F1)
    /* F1 uses the older libopencm3 GPIO API: mode + CNF in one call */
    gpio_set_mode(m_pin.port, GPIO_MODE_OUTPUT_2_MHZ,
                  GPIO_CNF_OUTPUT_PUSHPULL, m_pin.pin);
#elif defined(STM32F4)
    gpio_mode_setup(m_pin.port, GPIO_MODE_OUTPUT, GPIO_PUPD_NONE, m_pin.pin);
    gpio_set_output_options(m_pin.port, GPIO_OTYPE_PP, GPIO_OSPEED_2MHZ, m_pin.pin);
#else
#  error "Define STM32F1 or STM32F4 in your build system"
#endif
}

} // namespace hdlcd
