#include "cadence/runtime/runtime_config.h"
#include "cadence/core/exceptions.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <sstream>

namespace cadence {

// ============================================================================
// Internal Utilities
// ============================================================================

namespace {

std::string trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";

    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::string to_lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return str;
}

std::optional<std::string> get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value ? std::optional<std::string>(value) : std::nullopt;
}

std::optional<bool> parse_bool(const std::string& value) {
    std::string lower_value = to_lower(trim(value));

    if (lower_value == "true" || lower_value == "yes" || lower_value == "1" || lower_value == "on") {
        return true;
    } else if (lower_value == "false" || lower_value == "no" || lower_value == "0" || lower_value == "off") {
        return false;
    }

    return std::nullopt;
}

std::optional<std::size_t> parse_count(const std::string& value) {
    try {
        size_t consumed = 0;
        auto parsed = std::stoull(trim(value), &consumed);
        if (consumed != trim(value).size()) return std::nullopt;
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

/**
 * @brief Read a duration member: integer milliseconds or a duration string
 */
void read_duration(const nlohmann::json& section, const char* key, std::chrono::milliseconds& target) {
    if (!section.contains(key)) return;

    const auto& value = section.at(key);
    if (value.is_number_integer()) {
        target = std::chrono::milliseconds(value.get<long long>());
    } else if (value.is_string()) {
        if (auto parsed = parse_duration(value.get<std::string>())) {
            target = *parsed;
        } else {
            throw ConfigException("json", std::string("bad duration for '") + key + "'");
        }
    } else {
        throw ConfigException("json", std::string("'") + key + "' must be a number or duration string");
    }
}

template<typename T>
void read_value(const nlohmann::json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section.at(key).get<T>();
    }
}

std::string duration_string(std::chrono::milliseconds value) {
    return std::to_string(value.count()) + "ms";
}

void apply_environment(RuntimeConfig& config) {
    if (auto value = get_env("CADENCE_MAX_JOBS_PER_TICK")) {
        if (auto count = parse_count(*value); count && *count > 0) {
            config.scheduler.max_jobs_per_tick = *count;
        }
    }

    if (auto value = get_env("CADENCE_MAX_POOL_WORKERS")) {
        if (auto count = parse_count(*value); count && *count > 0 && *count <= 10000) {
            config.worker.max_pool_workers = *count;
        }
    }

    if (auto value = get_env("CADENCE_SLOT_RETRY_DELAY")) {
        if (auto delay = parse_duration(*value)) {
            config.scheduler.slot_retry_delay = *delay;
        }
    }

    if (auto value = get_env("CADENCE_SWEEP_INTERVAL")) {
        if (auto interval = parse_duration(*value)) {
            config.registry.sweep_interval = *interval;
        }
    }

    if (auto value = get_env("CADENCE_LOG_LEVEL")) {
        config.logging.level = log_level_from_string(trim(*value));
    }

    if (auto value = get_env("CADENCE_LOG_JSON")) {
        if (auto json = parse_bool(*value)) {
            config.logging.json = *json;
        }
    }

    if (auto value = get_env("CADENCE_DAEMON_REPORT_MODE")) {
        if (auto report = parse_bool(*value)) {
            config.logging.daemon_report_mode = *report;
        }
    }
}

} // anonymous namespace

std::optional<std::chrono::milliseconds> parse_duration(const std::string& duration_str) {
    static const std::regex duration_regex(R"(^(\d+)\s*(ms|s|sec|m|min)?$)");
    std::smatch match;

    std::string input = to_lower(trim(duration_str));
    if (!std::regex_match(input, match, duration_regex)) {
        return std::nullopt;
    }

    long long value = 0;
    try {
        value = std::stoll(match[1].str());
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    std::string unit = match[2].matched ? match[2].str() : "ms";

    if (unit == "ms") {
        return std::chrono::milliseconds(value);
    } else if (unit == "s" || unit == "sec") {
        return std::chrono::milliseconds(value * 1000);
    } else if (unit == "m" || unit == "min") {
        return std::chrono::milliseconds(value * 60 * 1000);
    }

    return std::nullopt;
}

std::string ValidationResult::to_string() const {
    std::ostringstream oss;
    oss << (is_valid ? "valid" : "invalid");
    for (const auto& error : errors) {
        oss << "\n  error: " << error;
    }
    for (const auto& warning : warnings) {
        oss << "\n  warning: " << warning;
    }
    return oss.str();
}

// ============================================================================
// RuntimeConfig Factory Methods
// ============================================================================

RuntimeConfig RuntimeConfig::defaults() {
    return RuntimeConfig{};
}

RuntimeConfig RuntimeConfig::development() {
    RuntimeConfig config;
    config.logging.level = LogLevel::DEBUG;
    config.logging.daemon_report_mode = true;
    return config;
}

RuntimeConfig RuntimeConfig::from_environment() {
    RuntimeConfig config;
    apply_environment(config);
    return config;
}

RuntimeConfig RuntimeConfig::with_environment_overrides() const {
    RuntimeConfig result = *this;
    apply_environment(result);
    return result;
}

// ============================================================================
// JSON Configuration Support
// ============================================================================

std::optional<RuntimeConfig> RuntimeConfig::from_json_file(const std::filesystem::path& config_path) {
    auto logger = LoggerFactory::get_logger("cadence.config");

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec)) {
        logger->warn("Configuration file not found: " + config_path.string());
        return std::nullopt;
    }

    std::ifstream input(config_path);
    if (!input) {
        logger->warn("Configuration file not readable: " + config_path.string());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << input.rdbuf();
    return from_json_string(buffer.str());
}

std::optional<RuntimeConfig> RuntimeConfig::from_json_string(const std::string& json_content) {
    RuntimeConfig config;

    try {
        auto root = nlohmann::json::parse(json_content);
        if (!root.is_object()) {
            throw ConfigException("json", "top level must be an object");
        }

        if (root.contains("scheduler")) {
            const auto& section = root.at("scheduler");
            read_value(section, "max_jobs_per_tick", config.scheduler.max_jobs_per_tick);
            read_duration(section, "empty_wait", config.scheduler.empty_wait);
            read_duration(section, "max_loop_wait", config.scheduler.max_loop_wait);
            read_duration(section, "slot_retry_delay", config.scheduler.slot_retry_delay);
            read_duration(section, "slot_retry_jitter", config.scheduler.slot_retry_jitter);
            read_duration(section, "fast_scheduler_threshold", config.scheduler.fast_scheduler_threshold);
        }

        if (root.contains("worker")) {
            const auto& section = root.at("worker");
            read_duration(section, "idle_wait", config.worker.idle_wait);
            read_duration(section, "dequeue_timeout", config.worker.dequeue_timeout);
            read_duration(section, "daemon_poll_interval", config.worker.daemon_poll_interval);
            read_value(section, "max_pool_workers", config.worker.max_pool_workers);
        }

        if (root.contains("registry")) {
            read_duration(root.at("registry"), "sweep_interval", config.registry.sweep_interval);
        }

        if (root.contains("sleep")) {
            const auto& section = root.at("sleep");
            read_duration(section, "sleep_threshold", config.sleep.sleep_threshold);
            read_duration(section, "awake_grace", config.sleep.awake_grace);
            read_duration(section, "check_period", config.sleep.check_period);
        }

        if (root.contains("subprocess")) {
            read_duration(root.at("subprocess"), "poll_timeout", config.subprocess.poll_timeout);
        }

        if (root.contains("slots")) {
            const auto& section = root.at("slots");
            if (!section.is_object()) {
                throw ConfigException("json", "'slots' must be an object of name -> limit");
            }
            for (const auto& [name, limit] : section.items()) {
                config.slots[name] = limit.get<std::size_t>();
            }
        }

        if (root.contains("logging")) {
            const auto& section = root.at("logging");
            read_value(section, "component_prefix", config.logging.component_prefix);
            if (section.contains("level")) {
                config.logging.level = log_level_from_string(section.at("level").get<std::string>());
            }
            read_value(section, "json", config.logging.json);
            read_value(section, "daemon_report_mode", config.logging.daemon_report_mode);
        }
    } catch (const nlohmann::json::exception& e) {
        LoggerFactory::get_logger("cadence.config")->warn(
            std::string("Failed to parse configuration: ") + e.what());
        return std::nullopt;
    } catch (const ConfigException& e) {
        LoggerFactory::get_logger("cadence.config")->warn(e.what());
        return std::nullopt;
    }

    return config;
}

nlohmann::json RuntimeConfig::to_json() const {
    nlohmann::json j;

    j["scheduler"] = {
        {"max_jobs_per_tick", scheduler.max_jobs_per_tick},
        {"empty_wait", duration_string(scheduler.empty_wait)},
        {"max_loop_wait", duration_string(scheduler.max_loop_wait)},
        {"slot_retry_delay", duration_string(scheduler.slot_retry_delay)},
        {"slot_retry_jitter", duration_string(scheduler.slot_retry_jitter)},
        {"fast_scheduler_threshold", duration_string(scheduler.fast_scheduler_threshold)},
    };

    j["worker"] = {
        {"idle_wait", duration_string(worker.idle_wait)},
        {"dequeue_timeout", duration_string(worker.dequeue_timeout)},
        {"daemon_poll_interval", duration_string(worker.daemon_poll_interval)},
        {"max_pool_workers", worker.max_pool_workers},
    };

    j["registry"] = {{"sweep_interval", duration_string(registry.sweep_interval)}};

    j["sleep"] = {
        {"sleep_threshold", duration_string(sleep.sleep_threshold)},
        {"awake_grace", duration_string(sleep.awake_grace)},
        {"check_period", duration_string(sleep.check_period)},
    };

    j["subprocess"] = {{"poll_timeout", duration_string(subprocess.poll_timeout)}};

    j["slots"] = slots;

    j["logging"] = {
        {"component_prefix", logging.component_prefix},
        {"level", to_string(logging.level)},
        {"json", logging.json},
        {"daemon_report_mode", logging.daemon_report_mode},
    };

    return j;
}

// ============================================================================
// Configuration Validation
// ============================================================================

ValidationResult RuntimeConfig::validate() const {
    ValidationResult result;

    auto require_positive = [&result](std::chrono::milliseconds value, const std::string& name) {
        if (value.count() <= 0) {
            result.is_valid = false;
            result.errors.push_back(name + " must be greater than 0");
        }
    };

    if (scheduler.max_jobs_per_tick == 0) {
        result.is_valid = false;
        result.errors.push_back("Max jobs per tick must be greater than 0");
    }

    require_positive(scheduler.empty_wait, "Scheduler empty wait");
    require_positive(scheduler.max_loop_wait, "Scheduler max loop wait");
    require_positive(scheduler.slot_retry_delay, "Slot retry delay");
    require_positive(worker.idle_wait, "Worker idle wait");
    require_positive(worker.dequeue_timeout, "Worker dequeue timeout");
    require_positive(worker.daemon_poll_interval, "Daemon poll interval");
    require_positive(registry.sweep_interval, "Registry sweep interval");
    require_positive(sleep.check_period, "Sleep check period");
    require_positive(subprocess.poll_timeout, "Subprocess poll timeout");

    if (scheduler.slot_retry_jitter.count() < 0) {
        result.is_valid = false;
        result.errors.push_back("Slot retry jitter must not be negative");
    }

    if (worker.max_pool_workers == 0) {
        result.is_valid = false;
        result.errors.push_back("Max pool workers must be greater than 0");
    }

    if (worker.max_pool_workers > 1000) {
        result.warnings.push_back("Max pool workers (" + std::to_string(worker.max_pool_workers) +
                                  ") is very high and may exhaust thread resources");
    }

    if (scheduler.max_loop_wait > std::chrono::seconds(10)) {
        result.warnings.push_back("Scheduler max loop wait above 10s delays shutdown and newly urgent jobs");
    }

    for (const auto& [name, limit] : slots) {
        if (name.empty()) {
            result.is_valid = false;
            result.errors.push_back("Slot names must not be empty");
        }
        if (limit == 0) {
            result.warnings.push_back("Slot '" + name + "' has a limit of 0; its jobs will never run");
        }
    }

    return result;
}

void RuntimeConfig::validate_or_throw(const std::string& source) const {
    auto result = validate();
    if (!result.is_valid) {
        throw ConfigException(source, result.errors.front());
    }
}

} // namespace cadence
