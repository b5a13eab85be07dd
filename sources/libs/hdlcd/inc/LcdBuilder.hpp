#ifndef HDLCD_LCD_BUILDER_HPP
#define HDLCD_LCD_BUILDER_HPP

#include "ExpanderTransport.hpp"
#include "LcdConfig.hpp"
#include "LcdController.hpp"
#include "ParallelTransport.hpp"

#include <memory>

namespace hdlcd {

// ─────────────────────────────────────────────────────────────────
// LcdBuilder
//
// Collects the panel options, wires a transport and runs the HD44780
// power-on sequence. A controller is only handed out when the whole
// sequence went through; on failure @p out is left untouched and the
// first error is returned.
//
//   LcdBuilder builder;
//   builder.lines(LineCount::Two).cursor(State::On);
//   std::unique_ptr<LcdController> lcd;
//   if (builder.buildExpander(channel, &busLock, delay, lcd) == LcdStatus::Ok) ...
// ─────────────────────────────────────────────────────────────────
class LcdBuilder {
public:
    explicit LcdBuilder(const LcdConfig &config = LCD_CONFIG_DEFAULTS)
        : m_config(config)
    {}

    LcdBuilder &lines(LineCount v)          { m_config.lines          = v;  return *this; }
    LcdBuilder &font(FontSize v)            { m_config.font           = v;  return *this; }
    LcdBuilder &columns(uint8_t v)          { m_config.columns        = v;  return *this; }
    LcdBuilder &display(State v)            { m_config.display        = v;  return *this; }
    LcdBuilder &cursor(State v)             { m_config.cursor         = v;  return *this; }
    LcdBuilder &blink(State v)              { m_config.blink          = v;  return *this; }
    LcdBuilder &direction(Direction v)      { m_config.direction      = v;  return *this; }
    LcdBuilder &autoscroll(State v)         { m_config.autoscroll     = v;  return *this; }
    LcdBuilder &backlight(State v)          { m_config.backlight      = v;  return *this; }
    LcdBuilder &timing(const LcdTiming &v)  { m_config.timing         = v;  return *this; }
    LcdBuilder &reliableInit(uint32_t us)   { m_config.reliableInitUs = us; return *this; }

    const LcdConfig &config() const { return m_config; }

    /** Direct GPIO wiring; the width follows the wiring (fourBit / eightBit). */
    LcdStatus buildParallel(const ParallelWiring           &wiring,
                            LcdDelay                       &delay,
                            std::unique_ptr<LcdController> &out) const;

    /**
     * I/O expander backpack, always 4-bit.
     * @param lock  shared-bus lock, or nullptr when the channel has no other users
     */
    LcdStatus buildExpander(ExpanderChannel                &channel,
                            BusLock                        *lock,
                            LcdDelay                       &delay,
                            std::unique_ptr<LcdController> &out,
                            const ExpanderWiring           &wiring = PCF8574_BACKPACK_WIRING) const;

    /** Any transport; it uses its own timing. */
    LcdStatus build(std::unique_ptr<LcdTransport>   transport,
                    std::unique_ptr<LcdController> &out) const;

private:
    friend class LcdController;

    LcdConfig m_config;

    LcdStatus resolve(LcdConfig &resolved) const;

    static LcdStatus initialise(LcdController &lcd);
};

} // namespace hdlcd

#endif /* HDLCD_LCD_BUILDER_HPP */
