#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <core/types.hpp>

// Positional words plus the flags each subcommand understands.
struct CliArgs {
    std::vector<std::string> words;
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<size_t> lines;
    bool enter = true;
};

// Parse the arguments after the subcommand name.
//
// Flags are recognised until the first command word: once `leading` words
// have been collected, the next word not starting with "--" and everything
// after it are taken verbatim. leading = 0 recognises flags everywhere.
// "--" ends flag parsing at any point.
Result<CliArgs> parse_cli_args(const std::vector<std::string>& args, size_t leading);

// Words from index `from` on, joined by single spaces.
std::string join_words(const std::vector<std::string>& words, size_t from);
