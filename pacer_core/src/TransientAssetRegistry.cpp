#include "TransientAssetRegistry.hpp"
#include "Errors.hpp"
#include "Logger.hpp"
#include <filesystem>
#include <system_error>

TransientAssetRegistry::TransientAssetRegistry(Logger& logger) : logger_(logger) {}

TransientAssetRegistry::~TransientAssetRegistry() {
    releaseAll();
}

bool TransientAssetRegistry::add(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (released_) {
        logger_.warning("Assets", "already released, not registering " + path);
        return false;
    }
    paths_.push_back(path);
    logger_.debug("Assets", "registered " + path);
    return true;
}

int TransientAssetRegistry::releaseAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (released_) return 0;
    released_ = true;

    int removed = 0;
    for (const auto& path : paths_) {
        try {
            if (removeIfExists(path)) {
                removed++;
                logger_.debug("Assets", "removed " + path);
            }
        } catch (const CleanupFailure& e) {
            logger_.warning("Assets", e.what());
        }
    }
    return removed;
}

bool TransientAssetRegistry::removeIfExists(const std::string& path) {
    std::error_code ec;
    bool gone = std::filesystem::remove(path, ec);   // false, no error: never existed
    if (ec) {
        throw CleanupFailure("could not remove " + path + ": " + ec.message());
    }
    return gone;
}

bool TransientAssetRegistry::isReleased() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_;
}

std::vector<std::string> TransientAssetRegistry::paths() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return paths_;
}

std::string TransientAssetRegistry::transientPath(const std::string& dir,
                                                  const std::string& stem,
                                                  long pid) {
    std::filesystem::path p(dir);
    p /= stem + "_" + std::to_string(pid) + ".wav";
    return p.string();
}
