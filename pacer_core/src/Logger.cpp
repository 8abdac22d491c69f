#include "Logger.hpp"
#include "Errors.hpp"
#include <iostream>

Logger::Logger(const std::string& filename, LogLevel threshold)
    : out_(&std::cerr), threshold_(threshold) {
    if (filename.empty()) return;

    file_.open(filename, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        throw ConfigurationError("cannot open log file: " + filename);
    }
    out_ = &file_;
}

Logger::Logger(std::ostream& out, LogLevel threshold)
    : out_(&out), threshold_(threshold) {}

Logger::~Logger() {
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::setThreshold(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex_);
    threshold_ = level;
}

void Logger::log(LogLevel level, const std::string& component, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex_);
    if (level < threshold_) return;

    *out_ << "[" << component << "] ";
    if (level == LogLevel::Warning) *out_ << "warning: ";
    else if (level == LogLevel::Error) *out_ << "error: ";
    *out_ << message << "\n";
    out_->flush();
    written_++;
}
