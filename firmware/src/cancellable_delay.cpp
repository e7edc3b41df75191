#include "cancellable_delay.h"
#include <chrono>

CancellableDelay::CancellableDelay()
    : _cancelled(false)
{
}

bool CancellableDelay::wait(uint32_t ms) {
    std::unique_lock<std::mutex> lock(_mutex);
    return _cond.wait_for(lock, std::chrono::milliseconds(ms), [this] { return _cancelled; });
}

void CancellableDelay::cancel() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _cancelled = true;
    }
    _cond.notify_all();
}

void CancellableDelay::reset() {
    std::lock_guard<std::mutex> lock(_mutex);
    _cancelled = false;
}

bool CancellableDelay::isCancelled() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _cancelled;
}
