#ifndef TRANSIENT_ASSET_REGISTRY_HPP
#define TRANSIENT_ASSET_REGISTRY_HPP

#include <mutex>
#include <string>
#include <vector>

class Logger;

/**
 * @brief  Files this run created and must delete before it exits.
 *
 *  A path is registered *before* the file is written, so an interrupt that
 *  lands while sox is still producing it gets it removed too. releaseAll()
 *  deletes whatever exists, once; after that the registry is spent and
 *  every further call (including the destructor's) does nothing.
 *
 *  add() and releaseAll() may run on different threads (main vs. the signal
 *  watcher).
 */
class TransientAssetRegistry {
public:
    explicit TransientAssetRegistry(Logger& logger);
    ~TransientAssetRegistry();

    TransientAssetRegistry(const TransientAssetRegistry&) = delete;
    TransientAssetRegistry& operator=(const TransientAssetRegistry&) = delete;

    // Returns false if the registry was already released; the caller should
    // not create the file then.
    bool add(const std::string& path);

    /**
     * @brief Delete every registered file that exists.
     *
     *  Missing files are not an error. A file that exists but can't be
     *  removed is logged as a cleanup failure and skipped; nothing is thrown.
     *
     * @return number of files actually removed by this call
     */
    int releaseAll();

    bool isReleased() const;
    std::vector<std::string> paths() const;

    // <dir>/<stem>_<pid>.wav; the pid keeps concurrent runs apart
    static std::string transientPath(const std::string& dir, const std::string& stem, long pid);

    // true if the file was there and is now gone; throws CleanupFailure otherwise
    static bool removeIfExists(const std::string& path);

private:
    Logger& logger_;
    mutable std::mutex mutex_;
    std::vector<std::string> paths_;
    bool released_ = false;
};

#endif  // TRANSIENT_ASSET_REGISTRY_HPP
