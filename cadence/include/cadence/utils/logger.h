#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace cadence {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO  = 2,
    WARN  = 3,
    ERROR = 4,
    FATAL = 5,
    OFF   = 6
};

[[nodiscard]] std::string to_string(LogLevel level);

/**
 * @brief Parse a level name (case-insensitive, "WARNING" accepted)
 * @return Parsed level, INFO for unknown names
 */
[[nodiscard]] LogLevel log_level_from_string(const std::string& level_str);

// ============================================================================
// Log Message
// ============================================================================

struct LogMessage {
    LogLevel level = LogLevel::INFO;
    std::string component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;

    /// Structured key-value fields attached with Logger::with_field
    std::unordered_map<std::string, std::string> fields;

    LogMessage() = default;
    LogMessage(LogLevel lvl, std::string comp, std::string msg,
               std::chrono::system_clock::time_point ts = std::chrono::system_clock::now());
};

// ============================================================================
// Formatters
// ============================================================================

class ILogFormatter {
public:
    virtual ~ILogFormatter() = default;
    virtual std::string format(const LogMessage& message) = 0;
};

/**
 * @brief `[2026-01-01T00:00:00.000Z] [INFO ] [component] message {k=v}`
 */
class TextFormatter : public ILogFormatter {
public:
    explicit TextFormatter(bool include_thread_id = false);
    std::string format(const LogMessage& message) override;

private:
    bool include_thread_id_;
};

/**
 * @brief One JSON object per message
 */
class JsonFormatter : public ILogFormatter {
public:
    explicit JsonFormatter(bool pretty_print = false);
    std::string format(const LogMessage& message) override;

private:
    bool pretty_print_;
};

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void write(const LogMessage& message, const std::string& formatted) = 0;
    virtual void flush() = 0;
};

/**
 * @brief Writes to stdout, or stderr for WARN and above
 */
class ConsoleSink : public ILogSink {
public:
    explicit ConsoleSink(bool use_colors = true);
    void write(const LogMessage& message, const std::string& formatted) override;
    void flush() override;

private:
    bool use_colors_;
    std::mutex mutex_;

    [[nodiscard]] static const char* color_code(LogLevel level);
};

/**
 * @brief Appends to a file with optional size-based rotation
 *
 * Rotation renames `file` to `file.1`, `file.1` to `file.2` and so on,
 * dropping anything beyond `max_files`.
 */
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& filename, bool append = true);
    ~FileSink() override;

    void write(const LogMessage& message, const std::string& formatted) override;
    void flush() override;
    void enable_rotation(std::size_t max_size_bytes, std::size_t max_files = 10);

private:
    std::string filename_;
    std::ofstream file_;
    std::mutex mutex_;

    bool rotation_enabled_ = false;
    std::size_t max_size_bytes_ = 0;
    std::size_t max_files_ = 0;
    std::size_t current_size_ = 0;

    void rotate_if_needed();
    void perform_rotation();
};

/**
 * @brief Keeps the most recent formatted lines in memory
 */
class MemorySink : public ILogSink {
public:
    explicit MemorySink(std::size_t capacity = 1000);

    void write(const LogMessage& message, const std::string& formatted) override;
    void flush() override {}

    [[nodiscard]] std::vector<std::string> lines() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] bool contains(const std::string& needle) const;
    void clear();

private:
    std::size_t capacity_;
    std::deque<std::string> lines_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

/**
 * @brief Component-scoped logger
 *
 * Fields added with with_field() are attached to the next message emitted by
 * this logger and then cleared.
 */
class Logger {
public:
    explicit Logger(std::string component);

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void trace(const std::string& message);
    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
    void fatal(const std::string& message);
    void log(LogLevel level, const std::string& message);

    Logger& with_field(const std::string& key, const std::string& value);

    template<typename T>
    Logger& with_field(const std::string& key, T value);

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel get_level() const;
    [[nodiscard]] bool is_enabled(LogLevel level) const;

    void add_sink(std::shared_ptr<ILogSink> sink);
    void clear_sinks();
    void set_formatter(std::shared_ptr<ILogFormatter> formatter);
    void flush();

    [[nodiscard]] const std::string& component() const;

private:
    std::string component_;
    std::atomic<LogLevel> min_level_{LogLevel::INFO};

    std::unordered_map<std::string, std::string> fields_;
    std::mutex fields_mutex_;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::shared_ptr<ILogFormatter> formatter_;
    mutable std::mutex config_mutex_;

    void do_log(LogLevel level, const std::string& message);
};

// ============================================================================
// Logger Registry
// ============================================================================

class LoggerFactory {
public:
    /**
     * @brief Get (creating on first use) the logger for a component
     *
     * New loggers start with the current global level, default sink and
     * default formatter.
     */
    static std::shared_ptr<Logger> get_logger(const std::string& component);

    static void set_global_level(LogLevel level);
    static void set_default_sink(std::shared_ptr<ILogSink> sink);
    static void set_default_formatter(std::shared_ptr<ILogFormatter> formatter);
    static void flush_all();

private:
    struct State;
    static State& state();
};

// ============================================================================
// Template Implementation
// ============================================================================

template<typename T>
Logger& Logger::with_field(const std::string& key, T value) {
    if constexpr (std::is_same_v<T, bool>) {
        return with_field(key, std::string(value ? "true" : "false"));
    } else if constexpr (std::is_arithmetic_v<T>) {
        return with_field(key, std::to_string(value));
    } else {
        static_assert(std::is_convertible_v<T, std::string>, "Type not supported for logging field");
        return with_field(key, std::string(value));
    }
}

} // namespace cadence
