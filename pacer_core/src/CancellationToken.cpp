#include "CancellationToken.hpp"

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_.store(true, std::memory_order_release);
    }
    cv_.notify_all();   // wake every waiter so none of them finishes its column
}

bool CancellationToken::waitFor(std::chrono::microseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    // wait_for with a predicate survives spurious wakeups
    const bool stopped = cv_.wait_for(lock, duration, [this]() {
        return cancelled_.load(std::memory_order_acquire);
    });
    return !stopped;
}
