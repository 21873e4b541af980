#pragma once

#include "cadence/core/time_utils.h"
#include "cadence/runtime/runtime_config.h"
#include "cadence/utils/logger.h"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace cadence {

class IController;

/**
 * @brief Which application shutdown flag governs a thread
 */
enum class ThreadClass : int {
    DAEMON = 0,   ///< Long-lived daemons and pool workers; stop at view shutdown
    OTHER = 1     ///< Schedulers and foreign threads; stop at model shutdown
};

[[nodiscard]] std::string to_string(ThreadClass thread_class);

/**
 * @brief Per-thread shutdown state
 *
 * `shutting_down` is one-way: once set it is never cleared for that thread.
 */
struct ThreadInfo {
    bool shutting_down = false;
    ThreadClass thread_class = ThreadClass::OTHER;
};

/**
 * @brief Weak handle to a registered thread; expires when that thread exits
 */
using ThreadLiveness = std::weak_ptr<const int>;

/**
 * @brief Registry of live threads and their cooperative shutdown flags
 *
 * Entries are created lazily on first lookup. A thread that looks itself up
 * attaches a liveness token. Thread ids are reused by the system once a thread
 * is joined, so an entry belongs to whichever live thread attached it: state
 * left on an unattached or expired entry is discarded when a thread claims
 * the id. Entries with no live owner are dropped by the periodic sweep, which
 * runs opportunistically on lookup once `sweep_interval` has elapsed since the
 * previous one.
 *
 * The registry starts closed. While closed every thread reports that it is
 * shutting down, so nothing polls past a checkpoint before open() or after
 * close().
 *
 * **Thread Safety**: All methods are thread-safe; one mutex guards the map
 * and is never held across a blocking call.
 */
class ThreadRegistry {
public:
    explicit ThreadRegistry(const IController& controller, RegistryConfig config = {});

    ThreadRegistry(const ThreadRegistry&) = delete;
    ThreadRegistry& operator=(const ThreadRegistry&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    void open();

    /**
     * @brief Mark every known thread shutting down and refuse further work
     */
    void close();

    [[nodiscard]] bool is_open() const noexcept;

    // ========================================================================
    // Per-thread State
    // ========================================================================

    /**
     * @brief Snapshot of a thread's info, creating the entry if absent
     */
    ThreadInfo get_info(std::thread::id id = std::this_thread::get_id());

    /**
     * @brief Register the calling thread with its class
     * @return The liveness handle identifying this thread's entry
     */
    ThreadLiveness attach_current_thread(ThreadClass thread_class);

    /**
     * @brief Set a thread's shutdown flag (idempotent)
     *
     * Only live registered threads carry a flag. An id with no live owner is
     * ignored and no entry is created for it.
     */
    void mark_shutting_down(std::thread::id id);

    /**
     * @brief Set the flag only while `liveness` still owns the id's entry
     *
     * A handle kept past its thread's exit never marks a later thread that
     * was given the same id.
     */
    void mark_shutting_down(std::thread::id id, const ThreadLiveness& liveness);

    /**
     * @brief Whether a thread must stop at its next checkpoint
     *
     * True if the process is fast-exiting, if the application shutdown flag
     * for the thread's class is set, if the registry is closed, or if the
     * thread's own flag is set.
     */
    [[nodiscard]] bool is_shutting_down(std::thread::id id = std::this_thread::get_id());

    [[nodiscard]] bool is_current_thread_shutting_down() { return is_shutting_down(); }

    /**
     * @brief Throw ShutdownSignal if the calling thread is shutting down
     */
    void check_current_thread();

    // ========================================================================
    // Maintenance
    // ========================================================================

    /**
     * @brief Remove entries whose thread has exited or that no thread claimed
     * @return Number of entries removed
     */
    std::size_t sweep();

    [[nodiscard]] std::size_t size() const;

private:
    struct Entry {
        ThreadInfo info;
        ThreadLiveness liveness;
        bool attached = false;

        [[nodiscard]] bool is_live() const { return attached && !liveness.expired(); }
    };

    Entry& lookup_locked(std::thread::id id);
    std::size_t sweep_locked();
    void sweep_if_due_locked();

    const IController& controller_;
    RegistryConfig config_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex mutex_;
    std::unordered_map<std::thread::id, Entry> threads_;
    TimePoint next_sweep_;
    std::atomic<bool> open_{false};
};

} // namespace cadence
