#pragma once
#include <stdint.h>
#include <stddef.h>
#include <atomic>
#include "led_animation.h"

// Line-based command console for a running animation
// Usage:
//   ConsoleCommandHandler console(animation);
//   console.begin();
//   std::thread t([&] { console.run(); });
//   ...
//   console.shutdown(); t.join();
//
// Commands (case-insensitive):
//   HELLO    version info
//   LIST     registered animation names
//   STOP     stop the running animation
class ConsoleCommandHandler {
public:
    explicit ConsoleCommandHandler(LedAnimation& animation);

    // Initialize console (adjust baud if needed)
    void begin(uint32_t baud = 115200);

    // Handle every byte received so far
    void poll();

    // Keep polling until STOP, end of input or shutdown()
    void run();

    // Make run() return; safe from any thread
    void shutdown() { _shutdown = true; }

    // Process one input byte
    // Returns: true once a STOP command has been handled
    bool feed(int c);

    bool stopHandled() const { return _stopHandled; }

private:
    static constexpr size_t CMD_BUF_SIZE = 128;
    static constexpr uint32_t POLL_INTERVAL_MS = 20;

    char _buf[CMD_BUF_SIZE];
    size_t _len = 0;
    bool _stopHandled = false;
    bool _overflow = false;
    bool _inputClosed = false;
    std::atomic<bool> _shutdown;
    LedAnimation& _animation;

    void handleLine(const char* line);

    // commands
    void cmdHello();
    void cmdList();
    void cmdStop();
};
