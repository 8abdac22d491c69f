#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <fstream>
#include <mutex>
#include <ostream>
#include <string>

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error
};

/**
 * @brief  Diagnostic log shared by every component.
 *
 *  Lines look like "[Component] message". They go to stderr (or to a file)
 *  so they don't land in the middle of the bar graph on stdout.
 *  The signal watcher thread logs too, hence the mutex.
 */
class Logger {
private:
    std::ofstream file_;
    std::ostream* out_;
    std::mutex logMutex_;
    LogLevel threshold_;
    int written_ = 0;

public:
    // Empty filename -> stderr. Throws ConfigurationError if the file can't be opened.
    explicit Logger(const std::string& filename = "", LogLevel threshold = LogLevel::Warning);
    // Log into an existing stream (tests use an ostringstream)
    explicit Logger(std::ostream& out, LogLevel threshold = LogLevel::Debug);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setThreshold(LogLevel level);
    LogLevel getThreshold() const { return threshold_; }
    int getWritten() const { return written_; }

    void log(LogLevel level, const std::string& component, const std::string& message);

    void debug(const std::string& component, const std::string& message)   { log(LogLevel::Debug, component, message); }
    void info(const std::string& component, const std::string& message)    { log(LogLevel::Info, component, message); }
    void warning(const std::string& component, const std::string& message) { log(LogLevel::Warning, component, message); }
    void error(const std::string& component, const std::string& message)   { log(LogLevel::Error, component, message); }
};

#endif  // LOGGER_HPP
