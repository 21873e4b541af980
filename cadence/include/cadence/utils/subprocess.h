#pragma once

#include <sys/types.h>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace cadence {

class IController;

struct ProcessResult {
    int exit_code = -1;          ///< Exit status, or 128 + signal number if killed by a signal
    std::string stdout_data;
    std::string stderr_data;
};

/**
 * @brief A spawned child process with piped stdout and stderr
 *
 * The destructor kills and reaps a child that is still running.
 */
class ChildProcess {
public:
    /**
     * @brief fork/exec `argv` (argv[0] is looked up on PATH)
     * @throws SubprocessException if the pipes or the fork fail
     */
    static ChildProcess spawn(const std::vector<std::string>& argv);

    ChildProcess(ChildProcess&& other) noexcept;
    ChildProcess& operator=(ChildProcess&& other) noexcept;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    /**
     * @brief Send SIGKILL (no-op once reaped)
     */
    void kill();

    /**
     * @brief Non-blocking reap
     * @return Exit code if the child has exited
     */
    std::optional<int> poll();

    [[nodiscard]] int stdout_fd() const noexcept { return stdout_fd_; }
    [[nodiscard]] int stderr_fd() const noexcept { return stderr_fd_; }

    void close_stdout();
    void close_stderr();

private:
    ChildProcess(pid_t pid, int stdout_fd, int stderr_fd);
    void release() noexcept;

    pid_t pid_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::optional<int> exit_code_;
};

/**
 * @brief Collect a child's output and exit status, staying responsive to shutdown
 *
 * Waits in slices of at most `poll_timeout`. If the controller reports model
 * shutdown before or during the wait, the child is killed and ShutdownSignal
 * is thrown.
 *
 * @throws ShutdownSignal on application shutdown
 * @throws SubprocessException if reading or reaping fails
 */
ProcessResult communicate(ChildProcess& child, const IController& controller,
                          std::chrono::milliseconds poll_timeout = std::chrono::seconds(10));

} // namespace cadence
