#include "console.h"
#include "animation_registry.h"
#include "fw_config.h"
#include "led_log.h"
#include "platform_serial.h"
#include "platform_timing.h"
#include <string.h>

ConsoleCommandHandler::ConsoleCommandHandler(LedAnimation& animation)
    : _shutdown(false)
    , _animation(animation)
{
}

void ConsoleCommandHandler::begin(uint32_t baud) {
    platform_serial_begin(baud);
    _len = 0;
    _overflow = false;
    _stopHandled = false;
    _inputClosed = false;
    _shutdown = false;
}

void ConsoleCommandHandler::poll() {
    while (platform_serial_available() > 0) {
        int c = platform_serial_read();
        if (c < 0) {
            _inputClosed = true;  // End of input
            break;
        }
        feed(c);
    }
}

void ConsoleCommandHandler::run() {
    while (!_stopHandled && !_inputClosed && !_shutdown) {
        poll();
        platform_delay_ms(POLL_INTERVAL_MS);
    }
}

bool ConsoleCommandHandler::feed(int c) {
    // Support \r\n / \n as line endings
    if (c == '\r') {
        return _stopHandled;
    }

    if (c == '\n') {
        _buf[_len] = '\0';
        if (_len > 0 && !_overflow) {
            handleLine(_buf);
        }
        _len = 0;
        _overflow = false;
    } else if (_overflow) {
        // Drop the rest of an over-long line
    } else if (_len < CMD_BUF_SIZE - 1) {
        _buf[_len++] = (char)c;
    } else {
        // Too long, discard this line
        _len = 0;
        _overflow = true;
    }
    return _stopHandled;
}

void ConsoleCommandHandler::handleLine(const char* line) {
    // Skip leading whitespace
    while (*line == ' ' || *line == '\t') {
        line++;
    }
    if (*line == '\0') {
        return;
    }

    char tmp[CMD_BUF_SIZE];
    strncpy(tmp, line, CMD_BUF_SIZE - 1);
    tmp[CMD_BUF_SIZE - 1] = '\0';

    // First token: command
    char* cmd = strtok(tmp, " \t");
    if (!cmd) {
        return;
    }

    // Convert to uppercase
    for (char* p = cmd; *p; ++p) {
        if (*p >= 'a' && *p <= 'z') {
            *p = *p - 'a' + 'A';
        }
    }
    log_debug("console", cmd);

    if (strcmp(cmd, "HELLO") == 0) {
        cmdHello();
    } else if (strcmp(cmd, "LIST") == 0) {
        cmdList();
    } else if (strcmp(cmd, "STOP") == 0) {
        cmdStop();
    } else {
        platform_serial_print("{\"event\":\"error\",\"msg\":\"unknown command: ");
        platform_serial_print(cmd);
        platform_serial_println("\"}");
        platform_serial_flush();
    }
}

void ConsoleCommandHandler::cmdHello() {
    platform_serial_print("{\"event\":\"hello\"");
    platform_serial_print(",\"version\":\"");
    platform_serial_print(LEDANIM_VERSION_STRING);
    platform_serial_print("\",\"build\":\"");
    platform_serial_print(LEDANIM_BUILD_HASH);
    platform_serial_print("\",\"date\":\"");
    platform_serial_print(LEDANIM_BUILD_DATE " " LEDANIM_BUILD_TIME);
    platform_serial_print("\",\"animation\":\"");
    platform_serial_print(_animation.name());
    platform_serial_println("\"}");
    platform_serial_flush();
}

void ConsoleCommandHandler::cmdList() {
    size_t count = 0;
    const AnimationEntry* entries = animationEntries(count);

    platform_serial_print("{\"event\":\"list\",\"animations\":[");
    for (size_t i = 0; i < count; i++) {
        if (i > 0) {
            platform_serial_print(",");
        }
        platform_serial_print("\"");
        platform_serial_print(entries[i].name);
        platform_serial_print("\"");
    }
    platform_serial_println("]}");
    platform_serial_flush();
}

void ConsoleCommandHandler::cmdStop() {
    _animation.stop();
    _stopHandled = true;
    platform_serial_print("{\"event\":\"stopping\",\"animation\":\"");
    platform_serial_print(_animation.name());
    platform_serial_println("\"}");
    platform_serial_flush();
}
