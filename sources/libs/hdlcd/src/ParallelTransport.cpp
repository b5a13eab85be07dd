#include "ParallelTransport.hpp"

namespace hdlcd {

/* ── Wiring helpers ──────────────────────────────────────────────────────── */
ParallelWiring ParallelWiring::fourBit(OutputLine &rs, OutputLine &enable,
                                       OutputLine &d4, OutputLine &d5,
                                       OutputLine &d6, OutputLine &d7)
{
    ParallelWiring w = {};
    w.rs      = &rs;
    w.enable  = &enable;
    w.data[4] = &d4;
    w.data[5] = &d5;
    w.data[6] = &d6;
    w.data[7] = &d7;
    w.width   = LineWidth::Four;
    return w;
}

ParallelWiring ParallelWiring::eightBit(OutputLine &rs, OutputLine &enable,
                                        OutputLine &d0, OutputLine &d1,
                                        OutputLine &d2, OutputLine &d3,
                                        OutputLine &d4, OutputLine &d5,
                                        OutputLine &d6, OutputLine &d7)
{
    ParallelWiring w = fourBit(rs, enable, d4, d5, d6, d7);
    w.data[0] = &d0;
    w.data[1] = &d1;
    w.data[2] = &d2;
    w.data[3] = &d3;
    w.width   = LineWidth::Eight;
    return w;
}

bool ParallelWiring::complete() const
{
    if ((rs == nullptr) || (enable == nullptr)) {
        return false;
    }

    const uint8_t first = (width == LineWidth::Eight) ? 0 : 4;
    for (uint8_t i = first; i < 8; ++i) {
        if (data[i] == nullptr) {
            return false;
        }
    }
    return true;
}

/* ── Transport ───────────────────────────────────────────────────────────── */
ParallelTransport::ParallelTransport(const ParallelWiring &wiring,
                                     LcdDelay             &delay,
                                     const LcdTiming      &timing)
    : LcdTransport(delay, timing)
    , m_wiring(wiring)
{}

LcdStatus ParallelTransport::reset()
{
    m_wiring.rs->set(false);
    m_wiring.enable->set(false);
    if (m_wiring.rw != nullptr) {
        m_wiring.rw->set(false);
    }

    if (m_wiring.width == LineWidth::Eight) {
        putAllLines(0x00);
    } else {
        putHighLines(0x00);
    }
    return LcdStatus::Ok;
}

LcdStatus ParallelTransport::send(uint8_t value, LcdMode mode)
{
    const uint32_t settle = settleDelayUs(m_timing, value, mode);

    m_wiring.rs->set(mode == LcdMode::Data);

    if (m_wiring.width == LineWidth::Eight) {
        putAllLines(value);
        pulseEnable(settle);
    } else {
        putHighLines(value >> 4);
        pulseEnable(m_timing.shortExecUs);
        putHighLines(value & 0x0F);
        pulseEnable(settle);
    }
    return LcdStatus::Ok;
}

LcdStatus ParallelTransport::sendInitNibble(uint8_t nibble)
{
    m_wiring.rs->set(false);

    if (m_wiring.width == LineWidth::Eight) {
        putAllLines(static_cast<uint8_t>((nibble & 0x0F) << 4));
    } else {
        putHighLines(nibble);
    }
    pulseEnable(m_timing.shortExecUs);
    return LcdStatus::Ok;
}

LcdStatus ParallelTransport::setBacklight(State state)
{
    if (m_wiring.backlight == nullptr) {
        return LcdStatus::Unsupported;
    }
    m_wiring.backlight->set(isOn(state));
    return LcdStatus::Ok;
}

/* ── Line helpers ────────────────────────────────────────────────────────── */
void ParallelTransport::putHighLines(uint8_t nibble)
{
    for (uint8_t i = 0; i < 4; ++i) {
        m_wiring.data[4 + i]->set(((nibble >> i) & 0x01) != 0);
    }
}

void ParallelTransport::putAllLines(uint8_t value)
{
    for (uint8_t i = 0; i < 8; ++i) {
        m_wiring.data[i]->set(((value >> i) & 0x01) != 0);
    }
}

/* ── EN strobe: latched on the falling edge ──────────────────────────────── */
void ParallelTransport::pulseEnable(uint32_t settleUs)
{
    m_wiring.enable->set(true);
    m_delay.waitUs(m_timing.enablePulseUs);     /* > 450 ns hold */
    m_wiring.enable->set(false);
    m_delay.waitUs(settleUs);
}

} // namespace hdlcd
