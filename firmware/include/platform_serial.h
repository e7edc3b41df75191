#pragma once
#include <stdint.h>
#include <stddef.h>

// =====================================================
// Platform Serial/Console Abstraction
// =====================================================
// Byte-level console used for logs, strip rendering
// and the command console.
//
// Usage:
//   - Call platform_serial_begin() once at startup
//   - Use platform_serial_* functions for all console I/O
// =====================================================

// Initialize console
// baud: baud rate (ignored on the host console)
void platform_serial_begin(uint32_t baud);

// Check if data is available to read
// Returns: number of bytes available (0 if none)
int platform_serial_available();

// Read a single byte from the console
// Returns: byte value (0-255) or -1 if no data available
int platform_serial_read();

// Print a string (no newline)
void platform_serial_print(const char* str);

// Print a string with newline
void platform_serial_println(const char* str);

// Flush output buffer
void platform_serial_flush();
