#pragma once
// =====================================================
// Animation Registry
// =====================================================
// Static name -> factory table used to pick an animation
// from configuration. Names:
//   breathe, chase, fill, refill, bounce, blink, alternating
//
// An unknown name is a caller error: lookups return
// nullptr and nothing is constructed.
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include <memory>
#include "led_animation.h"
#include "animation_config.h"

// Construction parameters; each animation reads the fields it needs
struct AnimationParams {
    Color color = {255, 255, 255};    // breathe/blink/alternating color, chase foreground, fill color
    Color backgroundColor = BLACK;    // chase
    bool reverse = false;             // fill, refill, bounce
    uint8_t numBlinks = ANIM_BLINK_DEFAULT_COUNT;  // blink
    bool repeat = false;              // blink
};

typedef std::unique_ptr<LedAnimation> (*AnimationFactory)(ILedStrip& leds, const AnimationParams& params);

struct AnimationEntry {
    const char* name;
    AnimationFactory create;
};

// Look up an entry by exact name
// Returns: nullptr if the name is not registered
const AnimationEntry* findAnimation(const char* name);

// Construct the named animation
// Returns: nullptr if the name is not registered
std::unique_ptr<LedAnimation> createAnimation(const char* name, ILedStrip& leds,
                                              const AnimationParams& params);

// Whole table, for listing
const AnimationEntry* animationEntries(size_t& count);
