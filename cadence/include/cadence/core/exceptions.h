#pragma once

#include <exception>
#include <string>

namespace cadence {

// ============================================================================
// Cooperative Shutdown
// ============================================================================

/**
 * @brief Raised at a shutdown checkpoint once the current thread is told to stop
 *
 * This is expected control flow, not a defect. Thread loops catch it at their
 * outermost level and return quietly; it is never logged as an error.
 */
class ShutdownSignal : public std::exception {
public:
    explicit ShutdownSignal(std::string reason = "Thread is shutting down!")
        : reason_(std::move(reason)) {}

    const char* what() const noexcept override { return reason_.c_str(); }

private:
    std::string reason_;
};

// ============================================================================
// Library Exceptions
// ============================================================================

/**
 * @brief Base exception for cadence errors
 */
class CadenceException : public std::exception {
public:
    explicit CadenceException(std::string message) : message_(std::move(message)) {}
    const char* what() const noexcept override { return message_.c_str(); }

private:
    std::string message_;
};

/**
 * @brief Thrown when configuration cannot be read or does not validate
 */
class ConfigException : public CadenceException {
public:
    ConfigException(const std::string& source, const std::string& reason)
        : CadenceException("Invalid configuration from " + source + ": " + reason) {}
};

/**
 * @brief Thrown on scheduler or pool misuse (double start, null job, use after shutdown)
 */
class SchedulerException : public CadenceException {
public:
    SchedulerException(const std::string& component, const std::string& reason)
        : CadenceException(component + ": " + reason) {}
};

/**
 * @brief Thrown when a child process cannot be spawned, read or reaped
 */
class SubprocessException : public CadenceException {
public:
    SubprocessException(const std::string& operation, int error_number);

    [[nodiscard]] int error_number() const noexcept { return error_number_; }

private:
    int error_number_;
};

} // namespace cadence
