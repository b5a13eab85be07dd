#ifndef HDLCD_FREERTOS_PORT_HPP
#define HDLCD_FREERTOS_PORT_HPP

#include "LcdCapabilities.hpp"

#include "FreeRTOS.h"
#include "semphr.h"

#include <stdint.h>

namespace hdlcd {

// ─────────────────────────────────────────────────────────────────
// FreeRtosDelay
//
// Millisecond waits yield to other tasks (vTaskDelay, at least one
// tick). Microsecond waits spin on the DWT cycle counter. Before the
// scheduler runs every wait spins, so a display can be built from
// main() as well as from a task.
// ─────────────────────────────────────────────────────────────────
class FreeRtosDelay : public LcdDelay {
public:
    FreeRtosDelay();

    void waitUs(uint32_t us) override;
    void waitMs(uint32_t ms) override;

private:
    void spinUs(uint32_t us);
};

// ─────────────────────────────────────────────────────────────────
// FreeRtosBusLock
//
// Mutex shared by every display on one expander bus. Create it once,
// before any display is built.
// ─────────────────────────────────────────────────────────────────
class FreeRtosBusLock : public BusLock {
public:
    FreeRtosBusLock()
        : m_mutex(NULL)
    {}

    // Call once before vTaskStartScheduler()
    void init()
    {
        m_mutex = xSemaphoreCreateMutex();
        configASSERT(m_mutex != NULL);
    }

    void lock() override
    {
        xSemaphoreTake(m_mutex, portMAX_DELAY);
    }

    void unlock() override
    {
        xSemaphoreGive(m_mutex);
    }

private:
    SemaphoreHandle_t m_mutex;
};

} // namespace hdlcd

#endif /* HDLCD_FREERTOS_PORT_HPP */
