#include "color.h"
#include <string.h>
#include <stdlib.h>
#include <ctype.h>

static uint8_t scaleChannel(uint8_t value, float factor) {
    float scaled = value * factor + 0.5f;
    if (scaled >= 255.0f) {
        return 255;
    }
    return (uint8_t)scaled;
}

Color Color::scaled(float factor) const {
    if (factor <= 0.0f) {
        return BLACK;
    }
    if (factor > 1.0f) {
        factor = 1.0f;
    }
    return Color{scaleChannel(r, factor), scaleChannel(g, factor), scaleChannel(b, factor)};
}

Color Color::fromHex(uint32_t rgb) {
    return Color{
        (uint8_t)((rgb >> 16) & 0xFF),
        (uint8_t)((rgb >> 8) & 0xFF),
        (uint8_t)(rgb & 0xFF)
    };
}

uint32_t Color::toHex() const {
    return ((uint32_t)r << 16) | ((uint32_t)g << 8) | (uint32_t)b;
}

bool parseColor(const char* text, Color& out) {
    if (!text) {
        return false;
    }

    if (strcmp(text, "off") == 0 || strcmp(text, "OFF") == 0) {
        out = BLACK;
        return true;
    }

    if (*text == '#') {
        text++;
    }

    // Exactly 6 hex digits
    if (strlen(text) != 6) {
        return false;
    }
    for (const char* p = text; *p; ++p) {
        if (!isxdigit((unsigned char)*p)) {
            return false;
        }
    }

    out = Color::fromHex((uint32_t)strtoul(text, nullptr, 16));
    return true;
}
