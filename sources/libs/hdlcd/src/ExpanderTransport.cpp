#include "ExpanderTransport.hpp"
#include "LcdLog.hpp"

namespace hdlcd {

ExpanderTransport::ExpanderTransport(ExpanderChannel      &channel,
                                     BusLock              *lock,
                                     LcdDelay             &delay,
                                     const LcdTiming      &timing,
                                     const ExpanderWiring &wiring,
                                     State                 backlight)
    : LcdTransport(delay, timing)
    , m_channel(channel)
    , m_lock(lock)
    , m_wiring(wiring)
    , m_backlight(backlight)
{}

uint8_t ExpanderTransport::backlightBits() const
{
    const bool level = (m_wiring.polarity == BacklightPolarity::ActiveHigh)
                     ? isOn(m_backlight)
                     : !isOn(m_backlight);
    return level ? static_cast<uint8_t>(1U << m_wiring.backlight) : 0;
}

uint8_t ExpanderTransport::frame(uint8_t nibble, LcdMode mode, bool enable) const
{
    uint8_t out = backlightBits();

    for (uint8_t i = 0; i < 4; ++i) {
        if ((nibble >> i) & 0x01) {
            out |= static_cast<uint8_t>(1U << m_wiring.data[i]);
        }
    }
    if (mode == LcdMode::Data) {
        out |= static_cast<uint8_t>(1U << m_wiring.rs);
    }
    if (enable) {
        out |= static_cast<uint8_t>(1U << m_wiring.enable);
    }
    return out;             /* RW bit never set */
}

/* ── Latch, EN high, EN low ──────────────────────────────────────────────── */
bool ExpanderTransport::strobeNibble(uint8_t nibble, LcdMode mode)
{
    if (!m_channel.write(frame(nibble, mode, false))) {
        return false;
    }
    if (!m_channel.write(frame(nibble, mode, true))) {
        return false;
    }
    m_delay.waitUs(m_timing.enablePulseUs);     /* > 450 ns hold */
    return m_channel.write(frame(nibble, mode, false));
}

LcdStatus ExpanderTransport::reset()
{
    bool ok;
    {
        BusGuard guard(m_lock);
        ok = m_channel.write(backlightBits());  /* all data low, doubles as probe */
    }

    if (!ok) {
        HDLCD_LOG("LCD: probe FAIL\n");
        return LcdStatus::BusError;
    }
    return LcdStatus::Ok;
}

LcdStatus ExpanderTransport::send(uint8_t value, LcdMode mode)
{
    bool ok;
    {
        BusGuard guard(m_lock);
        ok = strobeNibble(value >> 4, mode);
        if (ok) {
            m_delay.waitUs(m_timing.shortExecUs);
            ok = strobeNibble(value & 0x0F, mode);
        }
    }

    if (!ok) {
        HDLCD_LOG("LCD: write 0x%02X (%s) NACK\n",
                  static_cast<unsigned>(value), (mode == LcdMode::Data) ? "data" : "cmd");
        return LcdStatus::BusError;
    }

    m_delay.waitUs(settleDelayUs(m_timing, value, mode));
    return LcdStatus::Ok;
}

LcdStatus ExpanderTransport::sendInitNibble(uint8_t nibble)
{
    bool ok;
    {
        BusGuard guard(m_lock);
        ok = strobeNibble(nibble & 0x0F, LcdMode::Command);
    }

    if (!ok) {
        HDLCD_LOG("LCD: init nibble 0x%X NACK\n", static_cast<unsigned>(nibble & 0x0F));
        return LcdStatus::BusError;
    }

    m_delay.waitUs(m_timing.shortExecUs);
    return LcdStatus::Ok;
}

LcdStatus ExpanderTransport::setBacklight(State state)
{
    const State previous = m_backlight;
    m_backlight = state;

    bool ok;
    {
        BusGuard guard(m_lock);
        ok = m_channel.write(backlightBits());  /* apply immediately */
    }

    if (!ok) {
        m_backlight = previous;
        return LcdStatus::BusError;
    }
    return LcdStatus::Ok;
}

} // namespace hdlcd
