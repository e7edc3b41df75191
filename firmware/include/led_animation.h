#pragma once
// =====================================================
// LED Animation Base Class
// =====================================================
// Common lifecycle for every strip animation.
//
// Usage:
//   ChaseLedAnimation chase(strip, RED);
//   chase.start(5000);          // blocks up to ~5 s
//   chase.stop();               // from another thread
//
// start() runs on the calling thread until one of:
//   - stop() is called (observed within one wait step)
//   - the timeout elapsed (checked once per loop pass, so
//     a run may overshoot by up to one iteration)
//   - oneShot is set and one cycle completed
//
// Only one start() per instance may be in progress; a
// second concurrent call is refused and logged.
// =====================================================

#include <stdint.h>
#include <stddef.h>
#include <atomic>
#include "i_led_strip.h"
#include "cancellable_delay.h"

class LedAnimation {
public:
    static constexpr uint32_t NO_TIMEOUT = 0;

    virtual ~LedAnimation() = default;

    LedAnimation(const LedAnimation&) = delete;
    LedAnimation& operator=(const LedAnimation&) = delete;

    // Run the animation with its natural mode (Fill runs once,
    // every other animation runs until stopped)
    bool start();

    // Run the animation
    // timeoutMs: stop after this many ms (NO_TIMEOUT = never)
    // oneShot: stop after one cycle
    // Returns: false if the strip reported a failure or another
    //          start() is already running on this instance
    bool start(uint32_t timeoutMs, bool oneShot);

    // Request termination; safe from any thread
    virtual void stop();

    bool isRunning() const { return _running.load(); }
    const char* name() const { return _name; }

protected:
    LedAnimation(const char* name, ILedStrip& leds);

    // Pattern loop; called by start() with the flag cleared
    virtual bool run(bool oneShot) = 0;

    // Called by start() before run() to clear any owned sub-animation
    virtual void resetCancellation();

    virtual bool runsOnceByDefault() const { return false; }

    bool stopRequested() const { return _delay.isCancelled(); }
    bool timedOut() const;
    uint32_t timeoutMs() const { return _timeoutMs; }

    ILedStrip& _leds;
    CancellableDelay _delay;

private:
    const char* _name;
    std::atomic<bool> _running;
    uint32_t _startMs;
    uint32_t _timeoutMs;
};
