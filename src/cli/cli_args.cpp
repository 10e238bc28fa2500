#include "cli_args.hpp"
#include <core/utils.hpp>
#include <cmath>
#include <stdexcept>

Result<CliArgs> parse_cli_args(const std::vector<std::string>& args, size_t leading) {
    CliArgs out;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (leading > 0 && out.words.size() >= leading && a.rfind("--", 0) != 0) {
            out.words.insert(out.words.end(), args.begin() + static_cast<long>(i), args.end());
            break;
        }

        if (a == "--timeout" || a == "--lines") {
            if (i + 1 >= args.size()) {
                return Result<CliArgs>::Err("Missing value for " + a);
            }
            const std::string& v = args[++i];
            if (a == "--timeout") {
                double secs = 0;
                try {
                    secs = std::stod(v);
                } catch (const std::exception&) {
                    secs = 0;
                }
                if (secs <= 0) {
                    return Result<CliArgs>::Err("--timeout expects a positive number of seconds");
                }
                out.timeout = std::chrono::milliseconds(std::llround(secs * 1000.0));
            } else {
                if (!is_all_digits(v)) {
                    return Result<CliArgs>::Err("--lines expects a non-negative integer");
                }
                out.lines = static_cast<size_t>(safe_stoi(v, 0));
            }
        } else if (a == "--no-enter") {
            out.enter = false;
        } else if (a == "--") {
            out.words.insert(out.words.end(), args.begin() + static_cast<long>(i) + 1, args.end());
            break;
        } else {
            out.words.push_back(a);
        }
    }
    return Result<CliArgs>::Ok(std::move(out));
}

std::string join_words(const std::vector<std::string>& words, size_t from) {
    std::string out;
    for (size_t i = from; i < words.size(); ++i) {
        if (i > from) out += ' ';
        out += words[i];
    }
    return out;
}
