#include <iostream>
#include <vector>
#include <string>
#include <optional>
#include <chrono>
#include "cli/bridge_cli.hpp"
#include "cli/cli_args.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    tmuxbridge sessions"
              << theme::color::RESET << theme::color::DIM
              << "                          List live tmux sessions" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    tmuxbridge exec "
              << theme::color::RESET << "[--timeout SECS] <target> <command...>"
              << theme::color::DIM << "\n        Run a command and print its output" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    tmuxbridge send "
              << theme::color::RESET << "[--no-enter] <target> <text...>"
              << theme::color::DIM << "\n        Type text into the pane without waiting" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    tmuxbridge read "
              << theme::color::RESET << "<target> [--lines N]"
              << theme::color::DIM << "\n        Print the visible pane contents" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    tmuxbridge demo "
              << theme::color::RESET << "<target>"
              << theme::color::DIM << "\n        Walk through every operation" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    tmuxbridge init"
              << theme::color::RESET << theme::color::DIM
              << "                              Write a default config file" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    target is session[:window[.pane]]\n"
              << "    exec/send take words after the target verbatim; put flags first,\n"
              << "    or use -- when the command itself starts with --\n"
              << "    tmuxbridge --version    Show version\n"
              << "    tmuxbridge --help       Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    if (argc == 1) {
        print_usage();
        return EXIT_USAGE;
    }

    std::string cmd = argv[1];
    if (cmd == "--version") {
        std::cout << theme::color::BLUE << theme::color::BOLD << "tmuxbridge"
                  << theme::color::RESET << theme::color::DIM
                  << " version 0.1.0" << theme::color::RESET << "\n";
        return 0;
    } else if (cmd == "--help") {
        print_usage();
        return 0;
    }

    if (cmd == "init") {
        return BridgeCLI::run_init(get_active_config_path());
    }

    bool takes_command = cmd == "exec" || cmd == "send";
    auto parsed = parse_cli_args(std::vector<std::string>(argv + 2, argv + argc),
                                 takes_command ? 1 : 0);
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return EXIT_USAGE;
    }
    const CliArgs& args = parsed.value;

    auto config_result = Config::load_global();
    if (config_result.is_err()) {
        std::cout << theme::fail(config_result.error);
        return EXIT_USAGE;
    }
    const Config& config = config_result.value;
    if (!config.log_file().empty()) set_bridge_log_path(config.log_file());

    const auto& words = args.words;
    bool needs_target = cmd != "sessions";
    if (needs_target && words.empty()) {
        std::cout << theme::fail("Missing target.");
        print_usage();
        return EXIT_USAGE;
    }

    try {
        BridgeCLI cli(config);

        if (cmd == "sessions") {
            return cli.run_sessions();
        } else if (cmd == "exec") {
            if (words.size() < 2) {
                std::cout << theme::fail("Missing command.");
                std::cout << theme::step("Usage: tmuxbridge exec [--timeout SECS] <target> <command...>");
                return EXIT_USAGE;
            }
            return cli.run_exec(words[0], join_words(words, 1), args.timeout);
        } else if (cmd == "send") {
            return cli.run_send(words[0], join_words(words, 1), args.enter);
        } else if (cmd == "read") {
            return cli.run_read(words[0], args.lines);
        } else if (cmd == "demo") {
            return cli.run_demo(words[0]);
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return EXIT_USAGE;
    } catch (const SessionNotFoundError& e) {
        std::cout << theme::fail(e.what());
        return EXIT_SESSION_NOT_FOUND;
    } catch (const CommandTimeoutError& e) {
        std::cout << theme::fail(e.what());
        std::cout << theme::info("The command may still be running in the pane.");
        return EXIT_COMMAND_TIMEOUT;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_USAGE;
    }
}
