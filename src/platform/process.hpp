#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Owning handle to a spawned child process. The destructor kills and reaps a
// child that is still running, so no zombie outlives the handle.
class ProcessHandle {
public:
    ProcessHandle();
    explicit ProcessHandle(int pid);
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running. Reaps it if it has exited.
    bool running();

    // Wait for the process to exit. Returns the exit code, or -1 if it was
    // killed by a signal or timeout_ms elapsed first.
    // timeout_ms = -1 means indefinite wait.
    int wait(int timeout_ms = -1);

    // Terminate the process (SIGTERM, then SIGKILL after 2s).
    void terminate();

    // Signal that ended the process, 0 if it exited normally or is running.
    int term_signal() const { return term_signal_; }


private:
    void record_status(int status);

    int pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;
    int term_signal_ = 0;
};

// Run program with args to completion, collecting stdout and stderr.
// stdin is /dev/null. A non-zero exit is a successful Result carrying that
// exit code; Err is reserved for "could not run it": spawn or exec failure,
// death by signal, or exceeding timeout_ms (the child is then killed).
// timeout_ms <= 0 waits indefinitely.
Result<ProcessResult> run_process(const std::string& program,
                                  const std::vector<std::string>& args,
                                  int timeout_ms);

} // namespace platform
