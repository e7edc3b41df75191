#include "led_log.h"
#include "platform_serial.h"
#include <mutex>

static std::mutex s_logMutex;
static LogSink s_sink = nullptr;
static LogLevel s_level = static_cast<LogLevel>(LEDANIM_LOG_LEVEL);

static const char* levelPrefix(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "[D] ";
        case LogLevel::Info:    return "[I] ";
        case LogLevel::Warning: return "[W] ";
        case LogLevel::Error:
        default:
            return "[E] ";
    }
}

static void consoleSink(LogLevel level, const char* tag, const char* message) {
    platform_serial_print(levelPrefix(level));
    platform_serial_print(tag);
    platform_serial_print(": ");
    platform_serial_println(message);
    platform_serial_flush();
}

void log_set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(s_logMutex);
    s_sink = sink;
}

void log_set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(s_logMutex);
    s_level = level;
}

void log_message(LogLevel level, const char* tag, const char* message) {
    std::lock_guard<std::mutex> lock(s_logMutex);
    if (static_cast<uint8_t>(level) < static_cast<uint8_t>(s_level)) {
        return;
    }
    LogSink sink = s_sink ? s_sink : consoleSink;
    sink(level, tag ? tag : "", message ? message : "");
}

void log_debug(const char* tag, const char* message) {
    log_message(LogLevel::Debug, tag, message);
}

void log_info(const char* tag, const char* message) {
    log_message(LogLevel::Info, tag, message);
}

void log_warning(const char* tag, const char* message) {
    log_message(LogLevel::Warning, tag, message);
}

void log_error(const char* tag, const char* message) {
    log_message(LogLevel::Error, tag, message);
}
