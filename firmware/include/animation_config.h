#pragma once
// =====================================================
// Animation Timing Defaults
// =====================================================
// Default step delays for every animation, in milliseconds.
// Override via build flags (-DANIM_CHASE_STEP_DELAY_MS=50)
// or per instance with the animation's setters.
// =====================================================

// Breathe: brightness resolution (steps from off to full)
#ifndef ANIM_BREATHE_STEPS
#define ANIM_BREATHE_STEPS 20
#endif

#ifndef ANIM_BREATHE_STEP_DELAY_MS
#define ANIM_BREATHE_STEP_DELAY_MS 50
#endif

// Chase: time the active LED stays lit
#ifndef ANIM_CHASE_STEP_DELAY_MS
#define ANIM_CHASE_STEP_DELAY_MS 100
#endif

// Fill / Refill / Bounce: delay after each LED
#ifndef ANIM_FILL_STEP_DELAY_MS
#define ANIM_FILL_STEP_DELAY_MS 50
#endif

// Blink
#ifndef ANIM_BLINK_LEAD_IN_MS
#define ANIM_BLINK_LEAD_IN_MS 500
#endif

#ifndef ANIM_BLINK_ON_MS
#define ANIM_BLINK_ON_MS 250
#endif

#ifndef ANIM_BLINK_OFF_MS
#define ANIM_BLINK_OFF_MS 500
#endif

#ifndef ANIM_BLINK_REPEAT_PAUSE_MS
#define ANIM_BLINK_REPEAT_PAUSE_MS 2000
#endif

#ifndef ANIM_BLINK_DEFAULT_COUNT
#define ANIM_BLINK_DEFAULT_COUNT 2
#endif

// Alternating: time each even/odd frame is shown
#ifndef ANIM_ALTERNATING_DELAY_MS
#define ANIM_ALTERNATING_DELAY_MS 500
#endif
