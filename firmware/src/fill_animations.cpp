#include "led_animations.h"
#include "led_log.h"

// =====================================================
// Fill
// =====================================================

FillLedAnimation::FillLedAnimation(ILedStrip& leds, Color fillColor, bool reverse)
    : LedAnimation("fill", leds)
    , _fillColor(fillColor)
    , _reverse(reverse)
    , _stepDelayMs(ANIM_FILL_STEP_DELAY_MS)
{
}

bool FillLedAnimation::run(bool oneShot) {
    if (!oneShot || timeoutMs() != NO_TIMEOUT) {
        log_warning(name(), "persistent animation not supported, running a single pass");
    }
    return sweep();
}

bool FillLedAnimation::sweep() {
    size_t count = _leds.numLeds();
    for (size_t i = 0; i < count; i++) {
        if (stopRequested()) {
            break;
        }
        size_t led = _reverse ? (count - 1 - i) : i;
        if (!_leds.setLed(led, _fillColor)) {
            return false;
        }
        _delay.wait(_stepDelayMs);
    }
    return true;
}

// =====================================================
// Fill Cycle (Refill / Bounce)
// =====================================================

FillCycleLedAnimation::FillCycleLedAnimation(const char* name, ILedStrip& leds, Color fillColor,
                                             bool reverse, bool bounce)
    : LedAnimation(name, leds)
    , _fill(leds, fillColor, reverse)
    , _fillColor(fillColor)
    , _reverse(reverse)
    , _bounce(bounce)
{
}

void FillCycleLedAnimation::stop() {
    LedAnimation::stop();
    _fill.stop();
}

void FillCycleLedAnimation::resetCancellation() {
    // Cleared once per start(), never between passes, so a
    // stop() landing between two passes is not lost
    LedAnimation::resetCancellation();
    _fill._delay.reset();
}

bool FillCycleLedAnimation::run(bool oneShot) {
    bool ok = true;

    while (!stopRequested()) {
        _fill.setFillColor(_fillColor);
        _fill.setReverse(_reverse);
        if (!_fill.sweep()) {
            ok = false;
            break;
        }
        if (stopRequested()) {
            break;
        }

        _fill.setFillColor(BLACK);
        if (_bounce) {
            _fill.setReverse(!_reverse);
        }
        if (!_fill.sweep()) {
            ok = false;
            break;
        }

        if (oneShot || timedOut()) {
            break;
        }
    }

    _fill.setFillColor(_fillColor);
    _fill.setReverse(_reverse);

    if (!ok) {
        return false;
    }
    return _leds.fill(BLACK);
}

RefillLedAnimation::RefillLedAnimation(ILedStrip& leds, Color fillColor, bool reverse)
    : FillCycleLedAnimation("refill", leds, fillColor, reverse, false)
{
}

BounceLedAnimation::BounceLedAnimation(ILedStrip& leds, Color fillColor, bool reverse)
    : FillCycleLedAnimation("bounce", leds, fillColor, reverse, true)
{
}
