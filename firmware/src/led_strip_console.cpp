#include "i_led_strip.h"
#include "board_config.h"
#include "platform_serial.h"
#include <stdio.h>
#include <mutex>

// Host implementation of the LED strip: renders every shown
// frame as a row of 24-bit colored blocks on the console

class ConsoleLedStrip : public ILedStrip {
private:
    size_t _count;
    Color _pixels[LED_STRIP_MAX_LEDS];
    std::mutex _mutex;

    void render() {
        // "\r" keeps the strip on a single console line
        char cell[32];
        platform_serial_print("\r");
        for (size_t i = 0; i < _count; i++) {
            snprintf(cell, sizeof(cell), "\x1b[38;2;%u;%u;%um\xe2\x96\x88\xe2\x96\x88",
                     (unsigned)_pixels[i].r, (unsigned)_pixels[i].g, (unsigned)_pixels[i].b);
            platform_serial_print(cell);
        }
        platform_serial_print("\x1b[0m");
        platform_serial_flush();
    }

public:
    explicit ConsoleLedStrip(size_t count)
        : _count(count > LED_STRIP_MAX_LEDS ? LED_STRIP_MAX_LEDS : count)
    {
        for (size_t i = 0; i < LED_STRIP_MAX_LEDS; i++) {
            _pixels[i] = BLACK;
        }
    }

    size_t numLeds() const override {
        return _count;
    }

    bool setLed(size_t index, Color color, bool immediateShow) override {
        if (index >= _count) {
            return false;
        }
        std::lock_guard<std::mutex> lock(_mutex);
        _pixels[index] = color;
        if (immediateShow) {
            render();
        }
        return true;
    }

    bool fill(Color color) override {
        std::lock_guard<std::mutex> lock(_mutex);
        for (size_t i = 0; i < _count; i++) {
            _pixels[i] = color;
        }
        render();
        return true;
    }

    bool show() override {
        std::lock_guard<std::mutex> lock(_mutex);
        render();
        return true;
    }
};

// Global instance (created on first use)
static ConsoleLedStrip* g_ledStrip = nullptr;

// Factory function to create the strip instance
ILedStrip* createLedStrip(size_t ledCount) {
    if (g_ledStrip == nullptr) {
        g_ledStrip = new ConsoleLedStrip(ledCount);
    }
    return g_ledStrip;
}
