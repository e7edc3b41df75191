#pragma once
#include <stdint.h>
#include <mutex>
#include <condition_variable>

// =====================================================
// Cancellable Delay
// =====================================================
// Timed wait that returns as soon as cancel() is called
// from any thread. A wait issued after cancel() returns
// immediately until reset() clears the signal.
// =====================================================

class CancellableDelay {
public:
    CancellableDelay();

    CancellableDelay(const CancellableDelay&) = delete;
    CancellableDelay& operator=(const CancellableDelay&) = delete;

    // Block for up to ms milliseconds
    // Returns: true if cancelled (before or during the wait)
    bool wait(uint32_t ms);

    // Raise the signal and wake any waiter
    void cancel();

    // Clear the signal
    void reset();

    bool isCancelled() const;

private:
    mutable std::mutex _mutex;
    std::condition_variable _cond;
    bool _cancelled;
};
