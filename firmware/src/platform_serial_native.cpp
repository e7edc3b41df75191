// Platform serial implementation for host builds (stdin/stdout)
#include "platform_serial.h"
#include <stdio.h>
#include <poll.h>
#include <unistd.h>

void platform_serial_begin(uint32_t baud) {
    (void)baud;
    setvbuf(stdout, nullptr, _IOLBF, 0);
}

int platform_serial_available() {
    struct pollfd fd = { STDIN_FILENO, POLLIN, 0 };
    if (poll(&fd, 1, 0) <= 0) {
        return 0;
    }
    // POLLHUP at end of input also counts, so the next read reports it
    return (fd.revents & (POLLIN | POLLHUP)) ? 1 : 0;
}

int platform_serial_read() {
    // Unbuffered so available() and read() agree
    unsigned char c;
    if (read(STDIN_FILENO, &c, 1) != 1) {
        return -1;
    }
    return c;
}

void platform_serial_print(const char* str) {
    fputs(str, stdout);
}

void platform_serial_println(const char* str) {
    fputs(str, stdout);
    fputc('\n', stdout);
}

void platform_serial_flush() {
    fflush(stdout);
}
