#pragma once
#include <stdint.h>
#include <stdbool.h>

// =====================================================
// Color
// =====================================================
// 8-bit RGB value written to a single LED.
// No gamma or color-space correction is applied here;
// channels are passed to the strip as-is.
// =====================================================

struct Color {
    uint8_t r;
    uint8_t g;
    uint8_t b;

    // Multiply every channel by factor (clamped to 0..1), rounded
    Color scaled(float factor) const;

    bool isOff() const { return r == 0 && g == 0 && b == 0; }

    // 0xRRGGBB
    static Color fromHex(uint32_t rgb);
    uint32_t toHex() const;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

// Off state used whenever an animation clears the strip
constexpr Color BLACK = {0, 0, 0};

// Parse "RRGGBB", "#RRGGBB" or "off"
// Returns: false if the text is not a valid color
bool parseColor(const char* text, Color& out);
