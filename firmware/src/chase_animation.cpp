#include "led_animations.h"

ChaseLedAnimation::ChaseLedAnimation(ILedStrip& leds, Color foregroundColor, Color backgroundColor)
    : LedAnimation("chase", leds)
    , _foreground(foregroundColor)
    , _background(backgroundColor)
    , _stepDelayMs(ANIM_CHASE_STEP_DELAY_MS)
{
}

bool ChaseLedAnimation::run(bool oneShot) {
    if (!_leds.fill(_background)) {
        return false;
    }

    while (!stopRequested()) {
        size_t count = _leds.numLeds();
        for (size_t led = 0; led < count; led++) {
            if (!_leds.setLed(led, _foreground)) {
                return false;
            }
            _delay.wait(_stepDelayMs);
            if (!_leds.setLed(led, _background)) {
                return false;
            }
            if (stopRequested()) {
                break;
            }
        }

        if (oneShot || timedOut()) {
            break;
        }
    }

    return _leds.fill(BLACK);
}
