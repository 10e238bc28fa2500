#include "command_runner.hpp"
#include <core/log.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

TmuxProcessRunner::TmuxProcessRunner(TmuxSettings settings)
    : settings_(std::move(settings)) {}

std::vector<std::string> TmuxProcessRunner::build_args(
    const std::vector<std::string>& args) const {
    std::vector<std::string> full;
    if (!settings_.socket_path.empty()) {
        full.push_back("-S");
        full.push_back(settings_.socket_path);
    } else if (!settings_.socket_name.empty()) {
        full.push_back("-L");
        full.push_back(settings_.socket_name);
    }
    full.insert(full.end(), args.begin(), args.end());
    return full;
}

Result<ProcessResult> TmuxProcessRunner::run(const std::vector<std::string>& args) {
    auto full = build_args(args);
    auto result = platform::run_process(settings_.binary, full,
                                        settings_.command_timeout_ms);
    std::string label = args.empty() ? "tmux" : "tmux " + args.front();
    if (result.is_err()) {
        bridge_log(fmt::format("{} FAILED: {}", label, result.error));
        return result;
    }

    full.insert(full.begin(), settings_.binary);
    bridge_log_process(label, full, result.value);
    return result;
}
