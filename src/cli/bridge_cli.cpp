#include "bridge_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <tmux/command_runner.hpp>
#include <util/string_utils.hpp>
#include <fmt/format.h>
#include <iostream>

BridgeCLI::BridgeCLI(const Config& config)
    : transport_(std::make_shared<TmuxTransport>(
          std::make_shared<TmuxProcessRunner>(config.tmux()))),
      options_(ControllerOptions::from_settings(config.execute())) {}

BridgeCLI::BridgeCLI(std::shared_ptr<PaneTransport> transport, ControllerOptions options)
    : transport_(std::move(transport)), options_(std::move(options)) {}

TmuxController BridgeCLI::attach(const std::string& target) {
    return TmuxController(target, transport_, options_);
}

int BridgeCLI::run_sessions() {
    for (const auto& name : TmuxController::list_sessions(*transport_)) {
        std::cout << name << "\n";
    }
    return 0;
}

int BridgeCLI::run_exec(const std::string& target, const std::string& command,
                        std::optional<std::chrono::milliseconds> timeout) {
    auto ctrl = attach(target);
    auto result = ctrl.execute(command, timeout);
    std::cout << result.output;
    if (!result.output.empty()) std::cout << "\n";
    return result.exit_code.value_or(0);
}

int BridgeCLI::run_send(const std::string& target, const std::string& text, bool enter) {
    auto ctrl = attach(target);
    ctrl.send_keys(text, enter);
    return 0;
}

int BridgeCLI::run_read(const std::string& target, std::optional<size_t> lines) {
    auto ctrl = attach(target);
    std::string text = ctrl.read_buffer(lines);
    std::cout << text;
    if (!text.empty() && text.back() != '\n') std::cout << "\n";
    return 0;
}

int BridgeCLI::run_demo(const std::string& target) {
    std::cout << theme::step(fmt::format("Connecting to tmux target '{}' ...", target));
    auto ctrl = attach(target);
    auto sessions = TmuxController::list_sessions(*transport_);
    std::cout << theme::ok(fmt::format("Connected. Available sessions: {}",
                                       StringUtils::join(sessions, ", ")));

    std::cout << theme::section("ls -la");
    std::string listing = ctrl.execute_and_wait("ls -la");
    for (const auto& line : StringUtils::split_lines(listing)) {
        std::cout << theme::pane_line(line);
    }

    // Entries exclude the "total" header and blank lines
    int entries = 0;
    for (const auto& line : StringUtils::split_lines(listing)) {
        if (!StringUtils::trim(line).empty() && line.rfind("total", 0) != 0) ++entries;
    }
    std::cout << "\n" << theme::ok(fmt::format("Number of entries (including . and ..): {}", entries));

    for (const char* cmd : {"whoami", "hostname"}) {
        std::cout << theme::section(cmd);
        auto result = ctrl.execute(cmd);
        std::cout << theme::kv("output", StringUtils::trim(result.output));
        std::cout << theme::kv("exit", result.exit_code ? std::to_string(*result.exit_code) : "?");
        std::cout << theme::kv("elapsed", fmt::format("{}ms", result.elapsed.count()));
    }

    std::cout << theme::section("Visible buffer (last 5 lines)");
    for (const auto& line : StringUtils::split_lines(ctrl.read_buffer(5))) {
        std::cout << theme::pane_line(line);
    }

    std::cout << "\n" << theme::step("Sending keys without Enter ...");
    ctrl.send_keys("", false);
    std::cout << theme::ok("Done.");
    std::cout << theme::dim(fmt::format("    debug log: {}", bridge_log_path())) << "\n";
    return 0;
}

int BridgeCLI::run_init(const fs::path& path) {
    bool existed = fs::exists(path);
    auto result = create_default_config(path);
    if (result.is_err()) {
        std::cout << theme::fail("Failed to create config file: " + result.error);
        return EXIT_USAGE;
    }
    if (existed) {
        std::cout << theme::info(fmt::format("Config already exists, left unchanged: {}", path.string()));
    } else {
        std::cout << theme::ok(fmt::format("Wrote default config: {}", path.string()));
    }
    return 0;
}
