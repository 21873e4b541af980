#include "cadence/utils/subprocess.h"
#include "cadence/core/exceptions.h"
#include "cadence/runtime/controller.h"
#include "cadence/utils/logger.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

namespace cadence {

SubprocessException::SubprocessException(const std::string& operation, int error_number)
    : CadenceException("Subprocess " + operation + " failed: " + std::strerror(error_number))
    , error_number_(error_number) {
}

namespace {

constexpr std::size_t READ_CHUNK_SIZE = 4096;
constexpr std::chrono::milliseconds REAP_POLL_INTERVAL{20};

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool application_stopping(const IController& controller) {
    return controller.is_model_shutting_down() || controller.is_fast_exiting();
}

} // anonymous namespace

// ============================================================================
// ChildProcess
// ============================================================================

ChildProcess::ChildProcess(pid_t pid, int stdout_fd, int stderr_fd)
    : pid_(pid)
    , stdout_fd_(stdout_fd)
    , stderr_fd_(stderr_fd) {
}

ChildProcess ChildProcess::spawn(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        throw SubprocessException("spawn", EINVAL);
    }

    int out_pipe[2];
    int err_pipe[2];

    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        throw SubprocessException("pipe", errno);
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        int saved = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        throw SubprocessException("pipe", saved);
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        ::close(out_pipe[0]);
        ::close(out_pipe[1]);
        ::close(err_pipe[0]);
        ::close(err_pipe[1]);
        throw SubprocessException("fork", saved);
    }

    if (pid == 0) {
        // child: only async-signal-safe calls from here
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(args[0], args.data());

        const char message[] = "exec failed\n";
        [[maybe_unused]] auto written = ::write(STDERR_FILENO, message, sizeof(message) - 1);
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);

    LoggerFactory::get_logger("cadence.subprocess")
        ->with_field("pid", static_cast<long>(pid))
        .debug("Spawned " + argv[0]);

    return ChildProcess(pid, out_pipe[0], err_pipe[0]);
}

ChildProcess::ChildProcess(ChildProcess&& other) noexcept
    : pid_(std::exchange(other.pid_, -1))
    , stdout_fd_(std::exchange(other.stdout_fd_, -1))
    , stderr_fd_(std::exchange(other.stderr_fd_, -1))
    , exit_code_(std::exchange(other.exit_code_, std::nullopt)) {
}

ChildProcess& ChildProcess::operator=(ChildProcess&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = std::exchange(other.pid_, -1);
        stdout_fd_ = std::exchange(other.stdout_fd_, -1);
        stderr_fd_ = std::exchange(other.stderr_fd_, -1);
        exit_code_ = std::exchange(other.exit_code_, std::nullopt);
    }
    return *this;
}

ChildProcess::~ChildProcess() {
    release();
}

void ChildProcess::release() noexcept {
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);

    if (pid_ > 0 && !exit_code_) {
        ::kill(pid_, SIGKILL);
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
        }
    }
    pid_ = -1;
}

void ChildProcess::kill() {
    if (pid_ > 0 && !exit_code_) {
        ::kill(pid_, SIGKILL);
    }
}

std::optional<int> ChildProcess::poll() {
    if (exit_code_ || pid_ <= 0) {
        return exit_code_;
    }

    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == 0) {
        return std::nullopt;
    }
    if (rc < 0) {
        if (errno == EINTR) {
            return std::nullopt;
        }
        throw SubprocessException("waitpid", errno);
    }

    exit_code_ = decode_wait_status(status);
    return exit_code_;
}

void ChildProcess::close_stdout() {
    close_fd(stdout_fd_);
}

void ChildProcess::close_stderr() {
    close_fd(stderr_fd_);
}

// ============================================================================
// Shutdown-aware Wait
// ============================================================================

ProcessResult communicate(ChildProcess& child, const IController& controller,
                          std::chrono::milliseconds poll_timeout) {
    auto logger = LoggerFactory::get_logger("cadence.subprocess");

    auto check_shutdown = [&] {
        if (application_stopping(controller)) {
            logger->with_field("pid", static_cast<long>(child.pid())).info("Killing child for shutdown");
            child.kill();
            throw ShutdownSignal("Application is shutting down!");
        }
    };

    check_shutdown();

    ProcessResult result;
    char buffer[READ_CHUNK_SIZE];

    while (child.stdout_fd() >= 0 || child.stderr_fd() >= 0) {
        pollfd fds[2];
        nfds_t count = 0;
        if (child.stdout_fd() >= 0) {
            fds[count++] = pollfd{child.stdout_fd(), POLLIN, 0};
        }
        if (child.stderr_fd() >= 0) {
            fds[count++] = pollfd{child.stderr_fd(), POLLIN, 0};
        }

        int rc = ::poll(fds, count, static_cast<int>(poll_timeout.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw SubprocessException("poll", errno);
        }

        check_shutdown();

        if (rc == 0) {
            continue;
        }

        for (nfds_t i = 0; i < count; ++i) {
            if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) {
                continue;
            }

            bool is_stdout = fds[i].fd == child.stdout_fd();
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                (is_stdout ? result.stdout_data : result.stderr_data).append(buffer, static_cast<std::size_t>(n));
            } else if (n == 0) {
                if (is_stdout) {
                    child.close_stdout();
                } else {
                    child.close_stderr();
                }
            } else if (errno != EINTR && errno != EAGAIN) {
                throw SubprocessException("read", errno);
            }
        }
    }

    auto reap_wait = std::min(poll_timeout, REAP_POLL_INTERVAL);
    while (true) {
        if (auto code = child.poll()) {
            result.exit_code = *code;
            break;
        }
        check_shutdown();
        std::this_thread::sleep_for(reap_wait);
    }

    logger->with_field("exit_code", result.exit_code).debug("Child exited");
    return result;
}

} // namespace cadence
