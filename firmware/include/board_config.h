#pragma once
// =====================================================
// Board Configuration
// =====================================================
// Central location for strip and console settings.
// Override any value via build flags:
//   cmake -DCMAKE_CXX_FLAGS="-DLED_STRIP_COUNT=24" ...
// =====================================================

#include <stdint.h>

// =====================================================
// LED Strip
// =====================================================

// LEDs driven when no --leds argument is given
#ifndef LED_STRIP_COUNT
#define LED_STRIP_COUNT 12
#endif

// Upper bound for the strip buffer
#ifndef LED_STRIP_MAX_LEDS
#define LED_STRIP_MAX_LEDS 64
#endif

// =====================================================
// Console
// =====================================================
// Baud rate is ignored on the host console, kept for
// boards with a UART console

#ifndef SERIAL_BAUD_RATE
#define SERIAL_BAUD_RATE 115200
#endif
