#ifndef HDLCD_LCD_CAPABILITIES_HPP
#define HDLCD_LCD_CAPABILITIES_HPP

#include <stdint.h>

namespace hdlcd {

// ─────────────────────────────────────────────────────────────────
// Hardware capabilities consumed by the driver.
//
// The driver never touches a peripheral directly; the application
// hands it objects implementing these interfaces (see hdlcd_port for
// the libopencm3 / FreeRTOS versions). All of them must outlive the
// controller that uses them.
// ─────────────────────────────────────────────────────────────────

/** One digital output wired to an LCD pin. */
class OutputLine {
public:
    virtual ~OutputLine() {}

    virtual void set(bool high) = 0;
};

/** Blocking waits. */
class LcdDelay {
public:
    virtual ~LcdDelay() {}

    virtual void waitUs(uint32_t us) = 0;
    virtual void waitMs(uint32_t ms) = 0;
};

/**
 * Single-byte write to an I/O expander (e.g. PCF8574 behind a fixed
 * I2C address). Returns false when the byte was not acknowledged.
 */
class ExpanderChannel {
public:
    virtual ~ExpanderChannel() {}

    virtual bool write(uint8_t value) = 0;
};

/** Mutual exclusion for a channel shared by several displays. */
class BusLock {
public:
    virtual ~BusLock() {}

    virtual void lock()   = 0;
    virtual void unlock() = 0;
};

// Holds the lock for its scope. A null lock means "not shared".
class BusGuard {
public:
    explicit BusGuard(BusLock *lock)
        : m_lock(lock)
    {
        if (m_lock != nullptr) {
            m_lock->lock();
        }
    }

    ~BusGuard()
    {
        if (m_lock != nullptr) {
            m_lock->unlock();
        }
    }

    BusGuard(const BusGuard &)            = delete;
    BusGuard &operator=(const BusGuard &) = delete;

private:
    BusLock *m_lock;
};

} // namespace hdlcd

#endif /* HDLCD_LCD_CAPABILITIES_HPP */
