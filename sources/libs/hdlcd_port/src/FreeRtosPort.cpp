#include "FreeRtosPort.hpp"

#include <libopencm3/cm3/dwt.h>
#include <libopencm3/stm32/rcc.h>

#include "task.h"   /* vTaskDelay, xTaskGetSchedulerState */

namespace hdlcd {

FreeRtosDelay::FreeRtosDelay()
{
    dwt_enable_cycle_counter();
}

/* ── Busy wait on the core cycle counter ─────────────────────────────────── */
void FreeRtosDelay::spinUs(uint32_t us)
{
    const uint32_t cyclesPerUs = rcc_ahb_frequency / 1000000UL;
    const uint32_t start       = dwt_read_cycle_counter();
    const uint32_t cycles      = us * cyclesPerUs;

    /* Unsigned subtraction handles counter wrap */
    while ((dwt_read_cycle_counter() - start) < cycles) {
    }
}

void FreeRtosDelay::waitUs(uint32_t us)
{
    /* Whole milliseconds go to the scheduler */
    if (us >= 1000UL) {
        waitMs(us / 1000UL);
        us %= 1000UL;
    }
    spinUs(us);
}

void FreeRtosDelay::waitMs(uint32_t ms)
{
    if (xTaskGetSchedulerState() != taskSCHEDULER_RUNNING) {
        while (ms--) {
            spinUs(1000UL);
        }
        return;
    }

    if (ms == 0) {
        return;
    }

    /* vTaskDelay(n) may return after n-1 full ticks */
    vTaskDelay(pdMS_TO_TICKS(ms) + 1);
}

} // namespace hdlcd
