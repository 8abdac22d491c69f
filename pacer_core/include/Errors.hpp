#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Base class for every error the pacer raises itself.
 *
 *  Startup errors (configuration, division, tone synthesis) travel up to
 *  main() which reports them and exits before anything is rendered.
 *  Playback and cleanup failures are logged where they happen and never
 *  leave the component that hit them.
 */
class PacerError : public std::runtime_error {
public:
    explicit PacerError(const std::string& what) : std::runtime_error(what) {}
};

// A phase duration, column count or tone setting is out of range
class ConfigurationError : public PacerError {
public:
    explicit ConfigurationError(const std::string& what) : PacerError(what) {}
};

class DivisionByZero : public PacerError {
public:
    explicit DivisionByZero(const std::string& what) : PacerError(what) {}
};

// sox / aplay missing, failed to start, exited non-zero or was killed
class ExternalToolFailure : public PacerError {
public:
    explicit ExternalToolFailure(const std::string& what) : PacerError(what) {}
};

// The tool was stopped by SIGINT or SIGTERM, normally the user's Ctrl+C
class ExternalToolInterrupted : public ExternalToolFailure {
public:
    explicit ExternalToolInterrupted(const std::string& what) : ExternalToolFailure(what) {}
};

// Unknown option or an option missing its argument
class UsageError : public PacerError {
public:
    explicit UsageError(const std::string& what) : PacerError(what) {}
};

class CleanupFailure : public PacerError {
public:
    explicit CleanupFailure(const std::string& what) : PacerError(what) {}
};

#endif  // ERRORS_HPP
