#include "led_animation.h"
#include "led_log.h"
#include "platform_timing.h"

LedAnimation::LedAnimation(const char* name, ILedStrip& leds)
    : _leds(leds)
    , _name(name)
    , _running(false)
    , _startMs(0)
    , _timeoutMs(NO_TIMEOUT)
{
}

bool LedAnimation::start() {
    return start(NO_TIMEOUT, runsOnceByDefault());
}

bool LedAnimation::start(uint32_t timeoutMs, bool oneShot) {
    if (_running.exchange(true)) {
        log_error(_name, "start() called while already running, ignored");
        return false;
    }

    resetCancellation();
    _startMs = platform_millis();
    _timeoutMs = timeoutMs;

    if (_leds.numLeds() == 0) {
        log_warning(_name, "strip has no LEDs, nothing to animate");
        _running = false;
        return true;
    }

    bool ok = run(oneShot);
    if (!ok) {
        log_error(_name, "LED strip write failed, animation aborted");
    }

    _running = false;
    return ok;
}

void LedAnimation::stop() {
    _delay.cancel();
}

void LedAnimation::resetCancellation() {
    _delay.reset();
}

bool LedAnimation::timedOut() const {
    if (_timeoutMs == NO_TIMEOUT) {
        return false;
    }
    return (platform_millis() - _startMs) > _timeoutMs;
}
