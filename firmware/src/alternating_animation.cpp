#include "led_animations.h"

AlternatingLedAnimation::AlternatingLedAnimation(ILedStrip& leds, Color color)
    : LedAnimation("alternating", leds)
    , _color(color)
    , _delayMs(ANIM_ALTERNATING_DELAY_MS)
{
}

bool AlternatingLedAnimation::showFrame(bool evens) {
    size_t count = _leds.numLeds();
    for (size_t led = 0; led < count; led++) {
        bool lit = evens ? (led % 2 == 0) : (led % 2 == 1);
        if (!_leds.setLed(led, lit ? _color : BLACK, false)) {
            return false;
        }
    }
    return _leds.show();
}

bool AlternatingLedAnimation::run(bool oneShot) {
    if (!_leds.fill(BLACK)) {
        return false;
    }

    bool evens = true;
    while (!stopRequested()) {
        if (!showFrame(evens)) {
            return false;
        }
        _delay.wait(_delayMs);
        evens = !evens;

        // Back on the even frame: one even+odd cycle done
        if (oneShot && evens) {
            break;
        } else if (timedOut()) {
            break;
        }
    }

    return _leds.fill(BLACK);
}
