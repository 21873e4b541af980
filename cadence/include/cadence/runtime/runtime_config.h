#pragma once

#include "cadence/utils/logger.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cadence {

// ============================================================================
// Validation
// ============================================================================

struct ValidationResult {
    bool is_valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    [[nodiscard]] std::string to_string() const;
};

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * @brief Job scheduler tuning
 */
struct SchedulerConfig {
    std::size_t max_jobs_per_tick = 10;                     ///< Dispatch cap per loop iteration
    std::chrono::milliseconds empty_wait{200};              ///< Wait when nothing is pending
    std::chrono::milliseconds max_loop_wait{1000};          ///< Ceiling on any single wait
    std::chrono::milliseconds slot_retry_delay{10000};      ///< Reschedule delay after a refused slot
    std::chrono::milliseconds slot_retry_jitter{1000};      ///< Random extra on top of slot_retry_delay
    std::chrono::milliseconds fast_scheduler_threshold{1000}; ///< Delays up to this go to the fast scheduler
};

/**
 * @brief Daemon, queue worker and pool tuning
 */
struct WorkerConfig {
    std::chrono::milliseconds idle_wait{10000};             ///< Queue worker wait while its queue looks empty
    std::chrono::milliseconds dequeue_timeout{1000};        ///< Queue worker dequeue timeout
    std::chrono::milliseconds daemon_poll_interval{1000};   ///< Daemon checkpoint granularity
    std::size_t max_pool_workers = 200;                     ///< Pool size before workers are shared
};

struct RegistryConfig {
    std::chrono::milliseconds sweep_interval{600000};       ///< Dead thread sweep interval
};

/**
 * @brief Suspend/resume detection
 */
struct SleepConfig {
    std::chrono::milliseconds sleep_threshold{600000};      ///< Gap between checks that implies a suspend
    std::chrono::milliseconds awake_grace{15000};           ///< How long "just woke" stays true
    std::chrono::milliseconds check_period{15000};          ///< Sleep check job period
};

struct SubprocessConfig {
    std::chrono::milliseconds poll_timeout{10000};          ///< Shutdown re-check interval while waiting
};

struct LoggingConfig {
    std::string component_prefix = "cadence";
    LogLevel level = LogLevel::INFO;
    bool json = false;                                      ///< Emit JSON lines instead of text
    bool daemon_report_mode = false;                        ///< Daemons log each job they start
};

/**
 * @brief Complete runtime configuration
 *
 * @example
 * ```cpp
 * auto config = RuntimeConfig::from_json_file("cadence.json")
 *                   .value_or(RuntimeConfig::defaults())
 *                   .with_environment_overrides();
 * config.slots["thumbnails"] = 2;
 * Runtime runtime(config);
 * ```
 */
struct RuntimeConfig {
    SchedulerConfig scheduler;
    WorkerConfig worker;
    RegistryConfig registry;
    SleepConfig sleep;
    SubprocessConfig subprocess;
    LoggingConfig logging;

    /// Admission slot name -> maximum concurrent holders
    std::map<std::string, std::size_t> slots{{"misc", 10}};

    // ========================================================================
    // Factory Methods
    // ========================================================================

    static RuntimeConfig defaults();

    /**
     * @brief Debug logging and daemon report mode on
     */
    static RuntimeConfig development();

    /**
     * @brief Load configuration from a JSON file
     * @return Parsed configuration or std::nullopt if missing or malformed
     */
    static std::optional<RuntimeConfig> from_json_file(const std::filesystem::path& config_path);

    /**
     * @brief Load configuration from JSON text
     *
     * Keys that are absent keep their defaults. Durations are integer
     * milliseconds or strings such as "250ms", "10s", "2min".
     */
    static std::optional<RuntimeConfig> from_json_string(const std::string& json_content);

    /**
     * @brief Defaults with environment variable overrides applied
     *
     * Environment variables:
     * - CADENCE_MAX_JOBS_PER_TICK
     * - CADENCE_MAX_POOL_WORKERS
     * - CADENCE_SLOT_RETRY_DELAY
     * - CADENCE_SWEEP_INTERVAL
     * - CADENCE_LOG_LEVEL
     * - CADENCE_LOG_JSON
     * - CADENCE_DAEMON_REPORT_MODE
     */
    static RuntimeConfig from_environment();

    [[nodiscard]] RuntimeConfig with_environment_overrides() const;

    // ========================================================================
    // Validation and Serialization
    // ========================================================================

    [[nodiscard]] ValidationResult validate() const;

    [[nodiscard]] nlohmann::json to_json() const;

    /**
     * @brief Throw ConfigException if validate() reports errors
     */
    void validate_or_throw(const std::string& source) const;
};

/**
 * @brief Parse "250ms", "10s", "10sec", "2m", "2min" or a bare millisecond count
 */
[[nodiscard]] std::optional<std::chrono::milliseconds> parse_duration(const std::string& duration_str);

} // namespace cadence
