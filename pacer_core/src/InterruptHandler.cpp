#include "InterruptHandler.hpp"
#include "CancellationToken.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include "TransientAssetRegistry.hpp"
#include <cerrno>
#include <cstring>
#include <pthread.h>
#include <string>

namespace {

// how often the watcher looks up from sigtimedwait to see if it should stop
constexpr long WATCH_POLL_NS = 100L * 1000 * 1000;

}  // namespace

InterruptHandler::InterruptHandler(CancellationToken& token,
                                   TransientAssetRegistry& registry,
                                   Logger& logger)
    : token_(token), registry_(registry), logger_(logger) {
    sigemptyset(&signals_);
    sigaddset(&signals_, SIGINT);
    sigaddset(&signals_, SIGTERM);
}

InterruptHandler::~InterruptHandler() {
    uninstall();
}

void InterruptHandler::install() {
    if (watcher_.joinable()) return;

    int rc = pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
    if (rc != 0) {
        throw PacerError(std::string("cannot block SIGINT/SIGTERM: ") + std::strerror(rc));
    }

    stopping_.store(false, std::memory_order_release);
    watcher_ = std::thread(&InterruptHandler::watch, this);
    logger_.debug("Interrupt", "watching SIGINT and SIGTERM");
}

void InterruptHandler::uninstall() {
    if (!watcher_.joinable()) return;
    stopping_.store(true, std::memory_order_release);
    watcher_.join();
}

void InterruptHandler::watch() {
    const timespec interval{0, WATCH_POLL_NS};

    while (!stopping_.load(std::memory_order_acquire)) {
        int sig = sigtimedwait(&signals_, nullptr, &interval);
        if (sig < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            logger_.error("Interrupt", std::string("sigtimedwait failed: ") + std::strerror(errno));
            return;
        }

        lastSignal_.store(sig, std::memory_order_release);
        logger_.info("Interrupt", std::string("received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM"));
        trigger();
        return;     // one signal is enough; the process is on its way out
    }
}

bool InterruptHandler::trigger() {
    bool expected = false;
    if (!triggered_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return false;
    }

    // files first: once the token is cancelled main() may return at any moment
    int removed = registry_.releaseAll();
    logger_.debug("Interrupt", "removed " + std::to_string(removed) + " transient file(s)");

    token_.cancel();
    return true;
}
