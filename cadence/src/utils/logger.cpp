#include "cadence/utils/logger.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cadence {

// ============================================================================
// LogLevel Utilities
// ============================================================================

std::string to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
        default: return "UNKNOWN";
    }
}

LogLevel log_level_from_string(const std::string& level_str) {
    std::string upper_str = level_str;
    std::transform(upper_str.begin(), upper_str.end(), upper_str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper_str == "TRACE") return LogLevel::TRACE;
    if (upper_str == "DEBUG") return LogLevel::DEBUG;
    if (upper_str == "INFO")  return LogLevel::INFO;
    if (upper_str == "WARN" || upper_str == "WARNING") return LogLevel::WARN;
    if (upper_str == "ERROR") return LogLevel::ERROR;
    if (upper_str == "FATAL") return LogLevel::FATAL;
    if (upper_str == "OFF")   return LogLevel::OFF;

    return LogLevel::INFO;
}

LogMessage::LogMessage(LogLevel lvl, std::string comp, std::string msg,
                       std::chrono::system_clock::time_point ts)
    : level(lvl)
    , component(std::move(comp))
    , message(std::move(msg))
    , timestamp(ts)
    , thread_id(std::this_thread::get_id()) {
}

namespace {

std::string format_timestamp(std::chrono::system_clock::time_point timestamp) {
    auto time_t = std::chrono::system_clock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        timestamp.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z";
    return oss.str();
}

std::string thread_id_string(std::thread::id id) {
    std::ostringstream oss;
    oss << id;
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// TextFormatter
// ============================================================================

TextFormatter::TextFormatter(bool include_thread_id)
    : include_thread_id_(include_thread_id) {
}

std::string TextFormatter::format(const LogMessage& message) {
    std::ostringstream oss;

    oss << "[" << format_timestamp(message.timestamp) << "] ";
    oss << "[" << std::setw(5) << std::left << to_string(message.level) << "] ";

    if (!message.component.empty()) {
        oss << "[" << message.component << "] ";
    }

    if (include_thread_id_) {
        oss << "[thread=" << message.thread_id << "] ";
    }

    oss << message.message;

    if (!message.fields.empty()) {
        // sorted so output is stable
        std::vector<std::pair<std::string, std::string>> sorted(message.fields.begin(),
                                                                message.fields.end());
        std::sort(sorted.begin(), sorted.end());

        oss << " {";
        bool first = true;
        for (const auto& [key, value] : sorted) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

// ============================================================================
// JsonFormatter
// ============================================================================

JsonFormatter::JsonFormatter(bool pretty_print)
    : pretty_print_(pretty_print) {
}

std::string JsonFormatter::format(const LogMessage& message) {
    nlohmann::json j;
    j["timestamp"] = format_timestamp(message.timestamp);
    j["level"] = to_string(message.level);
    if (!message.component.empty()) {
        j["component"] = message.component;
    }
    j["thread_id"] = thread_id_string(message.thread_id);
    j["message"] = message.message;
    if (!message.fields.empty()) {
        j["fields"] = message.fields;
    }

    return j.dump(pretty_print_ ? 2 : -1);
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : use_colors_(use_colors) {
}

const char* ConsoleSink::color_code(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[1;31m";
        default: return "";
    }
}

void ConsoleSink::write(const LogMessage& message, const std::string& formatted) {
    std::lock_guard lock(mutex_);
    std::ostream& out = message.level >= LogLevel::WARN ? std::cerr : std::cout;

    if (use_colors_) {
        out << color_code(message.level) << formatted << "\033[0m\n";
    } else {
        out << formatted << "\n";
    }
}

void ConsoleSink::flush() {
    std::lock_guard lock(mutex_);
    std::cout.flush();
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& filename, bool append)
    : filename_(filename) {
    auto mode = std::ios::out | (append ? std::ios::app : std::ios::trunc);
    file_.open(filename_, mode);

    std::error_code ec;
    auto size = std::filesystem::file_size(filename_, ec);
    current_size_ = ec ? 0 : static_cast<std::size_t>(size);
}

FileSink::~FileSink() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(const LogMessage&, const std::string& formatted) {
    std::lock_guard lock(mutex_);
    if (!file_.is_open()) return;

    file_ << formatted << '\n';
    current_size_ += formatted.size() + 1;

    rotate_if_needed();
}

void FileSink::flush() {
    std::lock_guard lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::enable_rotation(std::size_t max_size_bytes, std::size_t max_files) {
    std::lock_guard lock(mutex_);
    rotation_enabled_ = true;
    max_size_bytes_ = max_size_bytes;
    max_files_ = max_files;
}

void FileSink::rotate_if_needed() {
    if (rotation_enabled_ && max_size_bytes_ > 0 && current_size_ >= max_size_bytes_) {
        perform_rotation();
    }
}

void FileSink::perform_rotation() {
    file_.close();

    std::error_code ec;
    if (max_files_ > 0) {
        std::filesystem::remove(filename_ + "." + std::to_string(max_files_), ec);
        for (std::size_t i = max_files_; i > 1; --i) {
            std::filesystem::path from = filename_ + "." + std::to_string(i - 1);
            if (std::filesystem::exists(from, ec)) {
                std::filesystem::rename(from, filename_ + "." + std::to_string(i), ec);
            }
        }
        std::filesystem::rename(filename_, filename_ + ".1", ec);
    } else {
        std::filesystem::remove(filename_, ec);
    }

    file_.open(filename_, std::ios::out | std::ios::trunc);
    current_size_ = 0;
}

// ============================================================================
// MemorySink
// ============================================================================

MemorySink::MemorySink(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {
}

void MemorySink::write(const LogMessage&, const std::string& formatted) {
    std::lock_guard lock(mutex_);
    lines_.push_back(formatted);
    while (lines_.size() > capacity_) {
        lines_.pop_front();
    }
}

std::vector<std::string> MemorySink::lines() const {
    std::lock_guard lock(mutex_);
    return {lines_.begin(), lines_.end()};
}

std::size_t MemorySink::size() const {
    std::lock_guard lock(mutex_);
    return lines_.size();
}

bool MemorySink::contains(const std::string& needle) const {
    std::lock_guard lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(), [&](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

void MemorySink::clear() {
    std::lock_guard lock(mutex_);
    lines_.clear();
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger(std::string component)
    : component_(std::move(component))
    , formatter_(std::make_shared<TextFormatter>()) {
}

void Logger::trace(const std::string& message) { log(LogLevel::TRACE, message); }
void Logger::debug(const std::string& message) { log(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message)  { log(LogLevel::INFO, message); }
void Logger::warn(const std::string& message)  { log(LogLevel::WARN, message); }
void Logger::error(const std::string& message) { log(LogLevel::ERROR, message); }
void Logger::fatal(const std::string& message) { log(LogLevel::FATAL, message); }

void Logger::log(LogLevel level, const std::string& message) {
    if (!is_enabled(level)) {
        std::lock_guard lock(fields_mutex_);
        fields_.clear();
        return;
    }
    do_log(level, message);
}

Logger& Logger::with_field(const std::string& key, const std::string& value) {
    std::lock_guard lock(fields_mutex_);
    fields_[key] = value;
    return *this;
}

void Logger::set_level(LogLevel level) {
    min_level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const {
    return min_level_.load(std::memory_order_relaxed);
}

bool Logger::is_enabled(LogLevel level) const {
    auto current = get_level();
    return current != LogLevel::OFF && level >= current;
}

void Logger::add_sink(std::shared_ptr<ILogSink> sink) {
    if (!sink) return;
    std::lock_guard lock(config_mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard lock(config_mutex_);
    sinks_.clear();
}

void Logger::set_formatter(std::shared_ptr<ILogFormatter> formatter) {
    if (!formatter) return;
    std::lock_guard lock(config_mutex_);
    formatter_ = std::move(formatter);
}

void Logger::flush() {
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard lock(config_mutex_);
        sinks = sinks_;
    }
    for (auto& sink : sinks) {
        sink->flush();
    }
}

const std::string& Logger::component() const {
    return component_;
}

void Logger::do_log(LogLevel level, const std::string& message) {
    LogMessage log_message(level, component_, message);
    {
        std::lock_guard lock(fields_mutex_);
        log_message.fields.swap(fields_);
    }

    std::vector<std::shared_ptr<ILogSink>> sinks;
    std::shared_ptr<ILogFormatter> formatter;
    {
        std::lock_guard lock(config_mutex_);
        sinks = sinks_;
        formatter = formatter_;
    }

    if (sinks.empty()) return;

    // sinks write outside the config lock
    std::string formatted = formatter->format(log_message);
    for (auto& sink : sinks) {
        sink->write(log_message, formatted);
    }
}

// ============================================================================
// LoggerFactory
// ============================================================================

struct LoggerFactory::State {
    std::mutex mutex;
    std::unordered_map<std::string, std::shared_ptr<Logger>> loggers;
    std::shared_ptr<ILogSink> default_sink = std::make_shared<ConsoleSink>(false);
    std::shared_ptr<ILogFormatter> default_formatter = std::make_shared<TextFormatter>();
    LogLevel global_level = LogLevel::INFO;
};

LoggerFactory::State& LoggerFactory::state() {
    static State instance;
    return instance;
}

std::shared_ptr<Logger> LoggerFactory::get_logger(const std::string& component) {
    auto& s = state();
    std::lock_guard lock(s.mutex);

    auto it = s.loggers.find(component);
    if (it != s.loggers.end()) {
        return it->second;
    }

    auto logger = std::make_shared<Logger>(component);
    logger->set_level(s.global_level);
    logger->add_sink(s.default_sink);
    logger->set_formatter(s.default_formatter);
    s.loggers.emplace(component, logger);
    return logger;
}

void LoggerFactory::set_global_level(LogLevel level) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.global_level = level;
    for (auto& [name, logger] : s.loggers) {
        logger->set_level(level);
    }
}

void LoggerFactory::set_default_sink(std::shared_ptr<ILogSink> sink) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    s.default_sink = std::move(sink);
}

void LoggerFactory::set_default_formatter(std::shared_ptr<ILogFormatter> formatter) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (formatter) {
        s.default_formatter = std::move(formatter);
    }
}

void LoggerFactory::flush_all() {
    std::vector<std::shared_ptr<Logger>> loggers;
    {
        auto& s = state();
        std::lock_guard lock(s.mutex);
        for (auto& [name, logger] : s.loggers) {
            loggers.push_back(logger);
        }
    }
    for (auto& logger : loggers) {
        logger->flush();
    }
}

} // namespace cadence
