#pragma once
#include <stdint.h>

// =====================================================
// Logging
// =====================================================
// Leveled log lines written through platform_serial as
//   [W] fill: message
//
// A sink can be installed to redirect lines, e.g. to
// capture warnings in unit tests.
// =====================================================

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

// Minimum level printed (override via build flags)
#ifndef LEDANIM_LOG_LEVEL
#define LEDANIM_LOG_LEVEL 1  // Info
#endif

typedef void (*LogSink)(LogLevel level, const char* tag, const char* message);

// Install a sink; nullptr restores console output
void log_set_sink(LogSink sink);

// Lines below this level are dropped
void log_set_level(LogLevel level);

void log_message(LogLevel level, const char* tag, const char* message);

void log_debug(const char* tag, const char* message);
void log_info(const char* tag, const char* message);
void log_warning(const char* tag, const char* message);
void log_error(const char* tag, const char* message);
