#pragma once
// =====================================================
// LED Strip Interface
// =====================================================
// Abstract interface for a linear array of addressable LEDs.
// Animations only talk to the strip through this interface,
// which allows running them against MockLedStrip in unit
// tests or against the console renderer on a host.
//
// Every write reports success. A false return means the
// device failed; animations stop immediately and pass the
// failure up to their caller.
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include "color.h"

class ILedStrip {
public:
    virtual ~ILedStrip() = default;

    // Number of addressable LEDs
    virtual size_t numLeds() const = 0;

    // Set a single LED. With immediateShow = false the write is
    // buffered until show() so several LEDs change in one frame.
    virtual bool setLed(size_t index, Color color, bool immediateShow = true) = 0;

    // Set every LED to the same color and show it
    virtual bool fill(Color color) = 0;

    // Flush buffered writes
    virtual bool show() = 0;
};

// Factory function to create the strip instance (platform-specific)
// ledCount: number of LEDs, capped at LED_STRIP_MAX_LEDS
ILedStrip* createLedStrip(size_t ledCount);
