#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>
#include <fmt/format.h>

#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <algorithm>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::ProcessHandle(int pid) : pid_(pid) {}

ProcessHandle::~ProcessHandle() {
    terminate();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_),
      exit_code_(other.exit_code_), term_signal_(other.term_signal_) {
    other.pid_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        terminate();
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        term_signal_ = other.term_signal_;
        other.pid_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::record_status(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
        term_signal_ = 0;
    } else if (WIFSIGNALED(status)) {
        exit_code_ = -1;
        term_signal_ = WTERMSIG(status);
    }
}

bool ProcessHandle::running() {
    if (!valid() || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        record_status(status);
        return false;
    }
    if (ret < 0) {
        // Not our child any more (ECHILD); nothing left to reap.
        reaped_ = true;
        return false;
    }
    return true;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (!valid()) return -1;
    if (reaped_) return exit_code_;

    if (timeout_ms < 0) {
        int status;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret == pid_) {
            record_status(status);
        } else {
            reaped_ = true;
        }
        return exit_code_;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (running()) {
        if (std::chrono::steady_clock::now() >= deadline) return -1;  // timed out
        sleep_ms(10);
    }
    return exit_code_;
}

void ProcessHandle::terminate() {
    if (!valid() || reaped_) return;
    if (!running()) return;

    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        if (!running()) return;
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    int status;
    if (waitpid(pid_, &status, 0) == pid_) {
        record_status(status);
    } else {
        reaped_ = true;
    }
}

// ── run_process ──────────────────────────────────────────────

namespace {

// Close-on-exec pipe that closes whatever ends are still open when destroyed.
class Pipe {
public:
    Pipe() = default;
    ~Pipe() { close_read(); close_write(); }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool open() { return pipe2(fds_, O_CLOEXEC) == 0; }

    int read_end() const { return fds_[0]; }
    int write_end() const { return fds_[1]; }

    void close_read() {
        if (fds_[0] >= 0) { ::close(fds_[0]); fds_[0] = -1; }
    }
    void close_write() {
        if (fds_[1] >= 0) { ::close(fds_[1]); fds_[1] = -1; }
    }

private:
    int fds_[2] = {-1, -1};
};

using Clock = std::chrono::steady_clock;

int remaining_ms(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

} // namespace

Result<ProcessResult> run_process(const std::string& program,
                                  const std::vector<std::string>& args,
                                  int timeout_ms) {
    Pipe out, err, exec_status;
    if (!out.open() || !err.open() || !exec_status.open()) {
        return Result<ProcessResult>::Err(
            fmt::format("pipe() failed: {}", std::strerror(errno)));
    }

    // Build argv before fork; the child only calls async-signal-safe functions.
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        return Result<ProcessResult>::Err(
            fmt::format("fork() failed: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        // Child process
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            if (devnull != STDIN_FILENO) ::close(devnull);
        }
        dup2(out.write_end(), STDOUT_FILENO);
        dup2(err.write_end(), STDERR_FILENO);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));

        int exec_errno = errno;
        ssize_t written = ::write(exec_status.write_end(), &exec_errno, sizeof(exec_errno));
        (void)written;
        _exit(127);  // exec failed
    }

    // Parent
    ProcessHandle handle(pid);
    out.close_write();
    err.close_write();
    exec_status.close_write();

    bool unlimited = timeout_ms <= 0;
    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);

    ProcessResult result;
    std::string* sinks[2] = {&result.stdout_data, &result.stderr_data};
    struct pollfd fds[2];
    fds[0] = {out.read_end(), POLLIN, 0};
    fds[1] = {err.read_end(), POLLIN, 0};
    char buf[PROCESS_READ_BUF_SIZE];

    while (fds[0].fd >= 0 || fds[1].fd >= 0) {
        int slice = PROCESS_POLL_SLICE_MS;
        if (!unlimited) {
            int left = remaining_ms(deadline);
            if (left == 0) {
                handle.terminate();
                return Result<ProcessResult>::Err(
                    fmt::format("{} timed out after {}ms", program, timeout_ms));
            }
            slice = std::min(slice, left);
        }

        int rc = ::poll(fds, 2, slice);
        if (rc < 0) {
            if (errno == EINTR) continue;
            int poll_errno = errno;
            handle.terminate();
            return Result<ProcessResult>::Err(
                fmt::format("poll() failed: {}", std::strerror(poll_errno)));
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) continue;
            ssize_t n = ::read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                fds[i].fd = -1;  // EOF; poll() skips negative fds
            }
        }
    }

    int exec_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_status.read_end(), &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        handle.wait();
        return Result<ProcessResult>::Err(
            fmt::format("failed to run {}: {}", program, std::strerror(exec_errno)));
    }

    int code = handle.wait(unlimited ? -1 : std::max(remaining_ms(deadline), 1));
    if (handle.term_signal() != 0) {
        return Result<ProcessResult>::Err(
            fmt::format("{} terminated by signal {}", program, handle.term_signal()));
    }
    if (code < 0) {
        handle.terminate();
        return Result<ProcessResult>::Err(
            fmt::format("{} timed out after {}ms", program, timeout_ms));
    }

    result.exit_code = code;
    return Result<ProcessResult>::Ok(std::move(result));
}

} // namespace platform
