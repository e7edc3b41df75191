#include "led_animations.h"

BlinkLedAnimation::BlinkLedAnimation(ILedStrip& leds, Color color, uint8_t numBlinks, bool repeat)
    : LedAnimation("blink", leds)
    , _color(color)
    , _numBlinks(numBlinks)
    , _repeat(repeat)
    , _leadInMs(ANIM_BLINK_LEAD_IN_MS)
    , _onMs(ANIM_BLINK_ON_MS)
    , _offMs(ANIM_BLINK_OFF_MS)
    , _repeatPauseMs(ANIM_BLINK_REPEAT_PAUSE_MS)
{
}

void BlinkLedAnimation::setTimings(uint32_t leadInMs, uint32_t onMs, uint32_t offMs, uint32_t repeatPauseMs) {
    _leadInMs = leadInMs;
    _onMs = onMs;
    _offMs = offMs;
    _repeatPauseMs = repeatPauseMs;
}

bool BlinkLedAnimation::run(bool oneShot) {
    if (!_leds.fill(BLACK)) {
        return false;
    }
    _delay.wait(_leadInMs);

    while (!stopRequested()) {
        for (uint8_t i = 0; i < _numBlinks; i++) {
            if (!_leds.fill(_color)) {
                return false;
            }
            if (_delay.wait(_onMs)) {
                break;
            }
            if (!_leds.fill(BLACK)) {
                return false;
            }
            if (_delay.wait(_offMs)) {
                break;
            }
        }

        // Without repeat one cycle is all there is
        if (oneShot || !_repeat) {
            break;
        }
        _delay.wait(_repeatPauseMs);
        if (timedOut()) {
            break;
        }
    }

    return _leds.fill(BLACK);
}
