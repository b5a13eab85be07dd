#include "LcdTypes.hpp"

namespace hdlcd {

const char *lcdStatusName(LcdStatus status)
{
    switch (status) {
        case LcdStatus::Ok:          return "ok";
        case LcdStatus::BusError:    return "bus error";
        case LcdStatus::NotReady:    return "not ready";
        case LcdStatus::BadPosition: return "bad position";
        case LcdStatus::BadSlot:     return "bad slot";
        case LcdStatus::BadConfig:   return "bad config";
        case LcdStatus::BadArgument: return "bad argument";
        case LcdStatus::Unsupported: return "unsupported";
    }
    return "unknown";
}

} // namespace hdlcd
