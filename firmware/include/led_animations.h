#pragma once
// =====================================================
// LED Animations
// =====================================================
// Concrete animations. Every animation except Fill turns
// all LEDs off before start() returns; Fill leaves its
// color on the strip.
//
// Default timings come from animation_config.h and can be
// changed per instance with the setters below.
// =====================================================

#include <stdint.h>
#include "led_animation.h"
#include "animation_config.h"

// =====================================================
// Breathe
// =====================================================
// All LEDs fade up and down together. One cycle is a full
// rise to full brightness and fall back to off.

class BreatheLedAnimation : public LedAnimation {
public:
    BreatheLedAnimation(ILedStrip& leds, Color color);

    void setColor(Color color) { _color = color; }
    void setStepDelay(uint32_t ms) { _stepDelayMs = ms; }

    // Number of steps between off and full brightness
    void setSteps(uint16_t steps) { _steps = steps > 0 ? steps : 1; }

protected:
    bool run(bool oneShot) override;

private:
    Color _color;
    uint16_t _steps;
    uint32_t _stepDelayMs;
};

// =====================================================
// Chase
// =====================================================
// LEDs are lit one at a time in index order. One cycle is
// a sweep over the whole strip.

class ChaseLedAnimation : public LedAnimation {
public:
    ChaseLedAnimation(ILedStrip& leds, Color foregroundColor, Color backgroundColor = BLACK);

    void setColors(Color foreground, Color background) {
        _foreground = foreground;
        _background = background;
    }
    void setStepDelay(uint32_t ms) { _stepDelayMs = ms; }

protected:
    bool run(bool oneShot) override;

private:
    Color _foreground;
    Color _background;
    uint32_t _stepDelayMs;
};

// =====================================================
// Fill
// =====================================================
// LEDs are set to fillColor one after another. Runs a
// single pass whatever timeout/oneShot say (a repeating
// request is logged as unsupported) and leaves the strip
// lit afterwards.

class FillLedAnimation : public LedAnimation {
public:
    FillLedAnimation(ILedStrip& leds, Color fillColor, bool reverse = false);

    void setFillColor(Color color) { _fillColor = color; }
    void setReverse(bool reverse) { _reverse = reverse; }
    void setStepDelay(uint32_t ms) { _stepDelayMs = ms; }

protected:
    bool run(bool oneShot) override;
    bool runsOnceByDefault() const override { return true; }

private:
    friend class FillCycleLedAnimation;

    // One pass over the strip; does not clear a pending stop
    bool sweep();

    Color _fillColor;
    bool _reverse;
    uint32_t _stepDelayMs;
};

// =====================================================
// Fill Cycle (Refill / Bounce)
// =====================================================
// Fills with fillColor, then fills with off, using an owned
// FillLedAnimation. One cycle is the color pass plus the
// off pass. stop() is forwarded to the inner fill.

class FillCycleLedAnimation : public LedAnimation {
public:
    void stop() override;

    void setFillColor(Color color) { _fillColor = color; }
    void setReverse(bool reverse) { _reverse = reverse; }
    void setStepDelay(uint32_t ms) { _fill.setStepDelay(ms); }

protected:
    // bounce: run the off pass in the opposite direction
    FillCycleLedAnimation(const char* name, ILedStrip& leds, Color fillColor,
                          bool reverse, bool bounce);

    bool run(bool oneShot) override;
    void resetCancellation() override;

private:
    FillLedAnimation _fill;
    Color _fillColor;
    bool _reverse;
    bool _bounce;
};

// Color pass and off pass in the same direction
class RefillLedAnimation : public FillCycleLedAnimation {
public:
    RefillLedAnimation(ILedStrip& leds, Color fillColor, bool reverse = false);
};

// Off pass runs back in the opposite direction
class BounceLedAnimation : public FillCycleLedAnimation {
public:
    BounceLedAnimation(ILedStrip& leds, Color fillColor, bool reverse = false);
};

// =====================================================
// Blink
// =====================================================
// Whole strip blinks numBlinks times. One cycle is the
// full set of blinks. Without repeat the animation ends
// after one cycle; with repeat, cycles are separated by a
// longer pause until stopped or timed out.

class BlinkLedAnimation : public LedAnimation {
public:
    BlinkLedAnimation(ILedStrip& leds, Color color,
                      uint8_t numBlinks = ANIM_BLINK_DEFAULT_COUNT, bool repeat = false);

    void setColor(Color color) { _color = color; }
    void setNumBlinks(uint8_t numBlinks) { _numBlinks = numBlinks; }
    void setRepeat(bool repeat) { _repeat = repeat; }
    void setTimings(uint32_t leadInMs, uint32_t onMs, uint32_t offMs, uint32_t repeatPauseMs);

protected:
    bool run(bool oneShot) override;

private:
    Color _color;
    uint8_t _numBlinks;
    bool _repeat;
    uint32_t _leadInMs;
    uint32_t _onMs;
    uint32_t _offMs;
    uint32_t _repeatPauseMs;
};

// =====================================================
// Alternating
// =====================================================
// Even and odd LEDs take turns. One cycle is an even frame
// followed by an odd frame.

class AlternatingLedAnimation : public LedAnimation {
public:
    AlternatingLedAnimation(ILedStrip& leds, Color color);

    void setColor(Color color) { _color = color; }
    void setDelay(uint32_t ms) { _delayMs = ms; }

protected:
    bool run(bool oneShot) override;

private:
    // Write one frame with even (or odd) LEDs lit
    bool showFrame(bool evens);

    Color _color;
    uint32_t _delayMs;
};
