#pragma once
#include <stdint.h>

// =====================================================
// Platform Timing Abstraction
// =====================================================
// Keeps animation timing independent of the target.
//
// Usage:
//   - Call platform_timing_init() once at startup
//   - Use platform_millis() to measure elapsed time
//   - Use platform_delay_ms() only for waits that never
//     need to be interrupted (see CancellableDelay)
// =====================================================

// Initialize timing system (call once at startup)
void platform_timing_init();

// Get milliseconds since startup (wraps every ~49 days)
uint32_t platform_millis();

// Blocking delay in milliseconds
void platform_delay_ms(uint32_t ms);
