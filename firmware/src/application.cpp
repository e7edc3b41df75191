#include "application.h"
#include "board_config.h"
#include "console.h"
#include "fw_config.h"
#include "led_log.h"
#include "platform_serial.h"
#include "platform_timing.h"
#include <stdlib.h>
#include <string.h>
#include <thread>

static const char* TAG = "app";

// Parse a decimal value; rejects empty strings and trailing garbage
static bool parseUnsigned(const char* text, uint32_t maxValue, uint32_t& out) {
    if (!text || *text == '\0') {
        return false;
    }
    char* end = nullptr;
    unsigned long value = strtoul(text, &end, 10);
    if (*end != '\0' || value > maxValue) {
        return false;
    }
    out = (uint32_t)value;
    return true;
}

Application::Application()
    : _strip(nullptr)
{
}

bool Application::parseArgs(int argc, char** argv, Options& out) {
    out = Options();
    out.ledCount = LED_STRIP_COUNT;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        const char* value = (i + 1 < argc) ? argv[i + 1] : nullptr;
        uint32_t number = 0;

        if (strcmp(arg, "--color") == 0) {
            if (!parseColor(value, out.params.color)) return false;
            i++;
        } else if (strcmp(arg, "--background") == 0) {
            if (!parseColor(value, out.params.backgroundColor)) return false;
            i++;
        } else if (strcmp(arg, "--reverse") == 0) {
            out.params.reverse = true;
        } else if (strcmp(arg, "--blinks") == 0) {
            if (!parseUnsigned(value, 255, number)) return false;
            out.params.numBlinks = (uint8_t)number;
            i++;
        } else if (strcmp(arg, "--repeat") == 0) {
            out.params.repeat = true;
        } else if (strcmp(arg, "--timeout") == 0) {
            if (!parseUnsigned(value, 0xFFFFFFFFUL, number)) return false;
            out.timeoutMs = number;
            out.explicitMode = true;
            i++;
        } else if (strcmp(arg, "--one-shot") == 0) {
            out.oneShot = true;
            out.explicitMode = true;
        } else if (strcmp(arg, "--verbose") == 0) {
            out.verbose = true;
        } else if (strcmp(arg, "--leds") == 0) {
            if (!parseUnsigned(value, LED_STRIP_MAX_LEDS, number)) return false;
            out.ledCount = number;
            i++;
        } else if (arg[0] == '-') {
            return false;
        } else if (!out.animationName) {
            out.animationName = arg;
        } else {
            return false;
        }
    }

    return out.animationName != nullptr;
}

bool Application::startAnimation(LedAnimation& animation, const Options& options) {
    if (!options.explicitMode) {
        return animation.start();
    }
    return animation.start(options.timeoutMs, options.oneShot);
}

void Application::printUsage() {
    platform_serial_println("usage: ledanim <animation> [--color RRGGBB] [--background RRGGBB] [--reverse]");
    platform_serial_println("               [--blinks N] [--repeat] [--timeout MS] [--one-shot] [--leds N]");
    platform_serial_println("               [--verbose]");
    platform_serial_print("animations:");

    size_t count = 0;
    const AnimationEntry* entries = animationEntries(count);
    for (size_t i = 0; i < count; i++) {
        platform_serial_print(" ");
        platform_serial_print(entries[i].name);
    }
    platform_serial_println("");
    platform_serial_flush();
}

bool Application::init(int argc, char** argv) {
    // Initialize platform abstractions
    platform_timing_init();
    platform_serial_begin(SERIAL_BAUD_RATE);

    if (!parseArgs(argc, argv, _options)) {
        log_error(TAG, "invalid arguments");
        printUsage();
        return false;
    }

    if (_options.verbose) {
        log_set_level(LogLevel::Debug);
    }
    log_debug(TAG, _options.animationName);

    _strip = createLedStrip(_options.ledCount);
    _animation = createAnimation(_options.animationName, *_strip, _options.params);
    if (!_animation) {
        printUsage();
        return false;
    }

    log_info(TAG, "ledanim " LEDANIM_VERSION_STRING " (" LEDANIM_BUILD_HASH ")");
    return true;
}

int Application::run() {
    if (!_animation) {
        return EXIT_USAGE;
    }

    ConsoleCommandHandler console(*_animation);
    console.begin(SERIAL_BAUD_RATE);

    std::thread consoleThread([&console] { console.run(); });

    log_info(_animation->name(), "started");
    bool ok = startAnimation(*_animation, _options);
    platform_serial_println("");
    log_info(_animation->name(), ok ? "finished" : "failed");

    console.shutdown();
    consoleThread.join();

    return ok ? EXIT_OK : EXIT_DEVICE_ERROR;
}
