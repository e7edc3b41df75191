#include "animation_registry.h"
#include "led_animations.h"
#include "led_log.h"
#include <string.h>

// =====================================================
// Factories
// =====================================================

static std::unique_ptr<LedAnimation> createBreathe(ILedStrip& leds, const AnimationParams& params) {
    return std::unique_ptr<LedAnimation>(new BreatheLedAnimation(leds, params.color));
}

static std::unique_ptr<LedAnimation> createChase(ILedStrip& leds, const AnimationParams& params) {
    return std::unique_ptr<LedAnimation>(new ChaseLedAnimation(leds, params.color, params.backgroundColor));
}

static std::unique_ptr<LedAnimation> createFill(ILedStrip& leds, const AnimationParams& params) {
    return std::unique_ptr<LedAnimation>(new FillLedAnimation(leds, params.color, params.reverse));
}

static std::unique_ptr<LedAnimation> createRefill(ILedStrip& leds, const AnimationParams& params) {
    return std::unique_ptr<LedAnimation>(new RefillLedAnimation(leds, params.color, params.reverse));
}

static std::unique_ptr<LedAnimation> createBounce(ILedStrip& leds, const AnimationParams& params) {
    return std::unique_ptr<LedAnimation>(new BounceLedAnimation(leds, params.color, params.reverse));
}

static std::unique_ptr<LedAnimation> createBlink(ILedStrip& leds, const AnimationParams& params) {
    return std::unique_ptr<LedAnimation>(
        new BlinkLedAnimation(leds, params.color, params.numBlinks, params.repeat));
}

static std::unique_ptr<LedAnimation> createAlternating(ILedStrip& leds, const AnimationParams& params) {
    return std::unique_ptr<LedAnimation>(new AlternatingLedAnimation(leds, params.color));
}

// =====================================================
// Table
// =====================================================

static const AnimationEntry ANIMATIONS[] = {
    { "breathe",     createBreathe },
    { "chase",       createChase },
    { "fill",        createFill },
    { "refill",      createRefill },
    { "bounce",      createBounce },
    { "blink",       createBlink },
    { "alternating", createAlternating },
};

static constexpr size_t ANIMATION_COUNT = sizeof(ANIMATIONS) / sizeof(ANIMATIONS[0]);

const AnimationEntry* findAnimation(const char* name) {
    if (!name) {
        return nullptr;
    }
    for (size_t i = 0; i < ANIMATION_COUNT; i++) {
        if (strcmp(ANIMATIONS[i].name, name) == 0) {
            return &ANIMATIONS[i];
        }
    }
    return nullptr;
}

std::unique_ptr<LedAnimation> createAnimation(const char* name, ILedStrip& leds,
                                              const AnimationParams& params) {
    const AnimationEntry* entry = findAnimation(name);
    if (!entry) {
        log_error("registry", "unknown animation name");
        return nullptr;
    }
    return entry->create(leds, params);
}

const AnimationEntry* animationEntries(size_t& count) {
    count = ANIMATION_COUNT;
    return ANIMATIONS;
}
