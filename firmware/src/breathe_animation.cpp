#include "led_animations.h"

BreatheLedAnimation::BreatheLedAnimation(ILedStrip& leds, Color color)
    : LedAnimation("breathe", leds)
    , _color(color)
    , _steps(ANIM_BREATHE_STEPS)
    , _stepDelayMs(ANIM_BREATHE_STEP_DELAY_MS)
{
}

bool BreatheLedAnimation::run(bool oneShot) {
    // Brightness is level / _steps; integer levels keep the
    // bounds exact so the direction flips at precisely 0 and 1
    int32_t level = 0;
    int32_t direction = 1;
    bool ending = false;

    while (!stopRequested()) {
        if (level >= _steps) {
            direction = -1;
        } else if (level <= 0) {
            direction = 1;
        }
        level += direction;

        float brightness = (float)level / (float)_steps;
        if (!_leds.fill(_color.scaled(brightness))) {
            return false;
        }
        _delay.wait(_stepDelayMs);

        if (oneShot && level >= _steps) {
            ending = true;
        } else if (ending && level <= 0) {
            break;
        } else if (timedOut()) {
            break;
        }
    }

    return _leds.fill(BLACK);
}
