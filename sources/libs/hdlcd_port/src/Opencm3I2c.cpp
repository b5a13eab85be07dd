#include "Opencm3I2c.hpp"
#include "LcdLog.hpp"

#include <libopencm3/stm32/rcc.h>
#include <libopencm3/stm32/gpio.h>
#include <libopencm3/stm32/i2c.h>

namespace hdlcd {

/* Polling budget for one bus event, a few ms at 72 MHz */
static const uint32_t I2C_SPIN_LIMIT = 100000UL;

/* ── I2C hardware setup ──────────────────────────────────────────────────── */
void Opencm3I2cBus::setup()
{
    /* Clock gates */
    rcc_periph_clock_enable(RCC_I2C1);
    rcc_periph_clock_enable(RCC_GPIOB);

#if defined(STM32F1)
    /* PB6 = SCL, PB7 = SDA, alternate function open-drain */
    gpio_set_mode(GPIOB,
                  GPIO_MODE_OUTPUT_50_MHZ,
                  GPIO_CNF_OUTPUT_ALTFN_OPENDRAIN,
                  GPIO6 | GPIO7);
#elif defined(STM32F4)
    /* PB6 = SCL, PB7 = SDA, AF4 open-drain */
    gpio_mode_setup(GPIOB, GPIO_MODE_AF, GPIO_PUPD_NONE, GPIO6 | GPIO7);
    gpio_set_output_options(GPIOB, GPIO_OTYPE_OD, GPIO_OSPEED_50MHZ, GPIO6 | GPIO7);
    gpio_set_af(GPIOB, GPIO_AF4, GPIO6 | GPIO7);
#else
#  error "Define STM32F1 or STM32F4 in your build system"
#endif

    /* Reset I2C1 via RCC (i2c_reset() not available on F1 libopencm3) */
    rcc_periph_reset_pulse(RST_I2C1);
    i2c_peripheral_disable(I2C1);

    i2c_set_clock_frequency(I2C1, m_apb1Mhz);

    /* Standard mode 100 kHz: CCR = Fpclk / (2 * Fscl) */
    i2c_set_standard_mode(I2C1);
    i2c_set_ccr(I2C1, static_cast<uint16_t>(m_apb1Mhz) * 5U);

    /* Trise = (Fpclk / 1000000) + 1 for standard mode */
    i2c_set_trise(I2C1, static_cast<uint16_t>(m_apb1Mhz) + 1U);

    i2c_peripheral_enable(I2C1);
}

/* ── Bus event polling ───────────────────────────────────────────────────── */
bool Opencm3I2cBus::waitIdle()
{
    for (uint32_t spin = 0; spin < I2C_SPIN_LIMIT; ++spin) {
        if (!(I2C_SR2(I2C1) & I2C_SR2_BUSY)) {
            return true;
        }
    }
    return false;
}

bool Opencm3I2cBus::waitStatus(uint32_t sr1Mask)
{
    for (uint32_t spin = 0; spin < I2C_SPIN_LIMIT; ++spin) {
        const uint32_t sr1 = I2C_SR1(I2C1);

        if (sr1 & I2C_SR1_AF) {
            I2C_SR1(I2C1) &= ~I2C_SR1_AF;   /* acknowledge failure, clear */
            return false;
        }
        if (sr1 & sr1Mask) {
            return true;
        }
    }
    return false;
}

/* ── Single byte write to the expander ───────────────────────────────────── */
bool Opencm3I2cBus::writeByte(uint8_t address, uint8_t data)
{
    if (!waitIdle()) {
        HDLCD_LOG("I2C: bus busy\n");
        return false;
    }

    i2c_send_start(I2C1);
    if (!waitStatus(I2C_SR1_SB)) {
        i2c_send_stop(I2C1);
        return false;
    }

    /* Send 7-bit address with write bit */
    i2c_send_7bit_address(I2C1, address, I2C_WRITE);
    if (!waitStatus(I2C_SR1_ADDR)) {
        i2c_send_stop(I2C1);
        HDLCD_LOG("I2C: 0x%02X no ACK\n", static_cast<unsigned>(address));
        return false;
    }
    /* Clear ADDR by reading SR2 */
    (void)I2C_SR2(I2C1);

    i2c_send_data(I2C1, data);
    /* BTF, not TxE: the data NACK only shows once the byte has shifted out */
    const bool acked = waitStatus(I2C_SR1_BTF);

    i2c_send_stop(I2C1);
    return acked;
}

} // namespace hdlcd
