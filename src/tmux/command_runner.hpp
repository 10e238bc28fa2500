#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Runs one tmux subcommand. args start at the subcommand name
// ("has-session", "-t", "work"); the runner supplies the binary and any
// server-selection options.
//
// Err means tmux could not be run to completion at all. A tmux that ran and
// exited non-zero is an Ok result carrying that exit code and stderr.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual Result<ProcessResult> run(const std::vector<std::string>& args) = 0;
};

// Spawns the real tmux binary per call.
class TmuxProcessRunner : public CommandRunner {
public:
    explicit TmuxProcessRunner(TmuxSettings settings = {});

    Result<ProcessResult> run(const std::vector<std::string>& args) override;

    // Full argv (after the binary) for a subcommand, including -L/-S.
    std::vector<std::string> build_args(const std::vector<std::string>& args) const;

    const TmuxSettings& settings() const { return settings_; }

private:
    TmuxSettings settings_;
};
