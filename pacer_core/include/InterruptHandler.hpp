#ifndef INTERRUPT_HANDLER_HPP
#define INTERRUPT_HANDLER_HPP

#include <atomic>
#include <csignal>
#include <ctime>
#include <thread>

class CancellationToken;
class Logger;
class TransientAssetRegistry;

/**
 * @brief  Turns Ctrl+C (SIGINT) or SIGTERM into "clean up and stop".
 *
 *  install() blocks both signals for the calling thread and every thread
 *  started after it, then starts a watcher thread sitting in sigwait(). No
 *  code runs inside a signal handler; the watcher is an ordinary thread and
 *  may lock mutexes and log.
 *
 *  On a signal the watcher calls trigger(): delete the transient files, then
 *  cancel the token, which wakes the render loop out of its column wait so
 *  main() can return without drawing anything more.
 *
 *  Call install() from main() before any other thread exists.
 */
class InterruptHandler {
public:
    InterruptHandler(CancellationToken& token, TransientAssetRegistry& registry, Logger& logger);
    ~InterruptHandler();

    InterruptHandler(const InterruptHandler&) = delete;
    InterruptHandler& operator=(const InterruptHandler&) = delete;

    // Throws PacerError if the signal mask can't be changed
    void install();

    // Stops the watcher thread; the signals stay blocked.
    void uninstall();

    /**
     * @brief Release resources and cancel. Idempotent; safe from any thread.
     * @return true for the call that actually did the work
     */
    bool trigger();

    bool isTriggered() const { return triggered_.load(std::memory_order_acquire); }
    int getLastSignal() const { return lastSignal_.load(std::memory_order_acquire); }

private:
    void watch();

    CancellationToken& token_;
    TransientAssetRegistry& registry_;
    Logger& logger_;

    sigset_t signals_;
    std::thread watcher_;
    std::atomic<bool> triggered_{false};
    std::atomic<bool> stopping_{false};
    std::atomic<int> lastSignal_{0};
};

#endif  // INTERRUPT_HANDLER_HPP
