// Platform timing implementation for host builds
#include "platform_timing.h"
#include <chrono>
#include <thread>

static std::chrono::steady_clock::time_point startTime() {
    static const std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
    return start;
}

void platform_timing_init() {
    // Pin the epoch before the first measurement
    startTime();
}

uint32_t platform_millis() {
    auto elapsed = std::chrono::steady_clock::now() - startTime();
    return (uint32_t)std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();
}

void platform_delay_ms(uint32_t ms) {
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}
