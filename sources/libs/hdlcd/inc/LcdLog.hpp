#ifndef HDLCD_LCD_LOG_HPP
#define HDLCD_LCD_LOG_HPP

/*
 * Driver diagnostics.
 *
 * Build with HDLCD_DEBUG_ACTIVE=1 to route the driver's messages to the
 * shell console through uSHELL_PRINTF; otherwise they compile away.
 */

#ifndef HDLCD_DEBUG_ACTIVE
#  define HDLCD_DEBUG_ACTIVE 0
#endif

#if (1 == HDLCD_DEBUG_ACTIVE)
#  include "ushell_core_printout.h"
#  define HDLCD_LOG(...)  uSHELL_PRINTF(__VA_ARGS__)
#else
#  define HDLCD_LOG(...)  do {} while (0)
#endif

#endif /* HDLCD_LCD_LOG_HPP */
