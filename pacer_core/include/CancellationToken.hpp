#ifndef CANCELLATION_TOKEN_HPP
#define CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

/**
 * @brief One-shot stop flag that a sleeping thread can be woken by.
 *
 *  The render loop sleeps through waitFor() instead of sleep_for() so that an
 *  interrupt ends the current column wait right away. Once cancelled the
 *  token stays cancelled.
 */
class CancellationToken {
public:
    void cancel();
    bool isCancelled() const { return cancelled_.load(std::memory_order_acquire); }

    /**
     * @brief Block for `duration`, or less if cancel() is called meanwhile.
     * @return true if the full duration elapsed, false if cancelled.
     */
    bool waitFor(std::chrono::microseconds duration);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
};

#endif  // CANCELLATION_TOKEN_HPP
