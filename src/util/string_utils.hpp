#pragma once

#include <string>
#include <vector>

namespace StringUtils {
std::vector<std::string> split(const std::string& str, char delimiter);

// Split captured text into lines. A single trailing newline does not produce
// an empty final line; "\r\n" endings lose their '\r'.
std::vector<std::string> split_lines(const std::string& text);

std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Last n lines of text in original order (all of it if it has fewer).
std::string tail_lines(const std::string& text, size_t n);

bool ends_with(const std::string& str, const std::string& suffix);
std::string trim(const std::string& str);
}
