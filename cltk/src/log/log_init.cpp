//! # Log Initialization from CLI
//!
//! Strips the global logging options out of a tool's argument list and turns
//! them, or the CLTK_LOG environment variable, into a LogConfig.

#include "log/log.hpp"

#include <cstdlib>
#include <string>

namespace cltk::log {

namespace {

/// True for "-v", "-vv", "-vvv", ...
bool is_verbosity_flag(const std::string& arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        return false;
    for (size_t j = 1; j < arg.size(); ++j) {
        if (arg[j] != 'v')
            return false;
    }
    return true;
}

} // namespace

LogConfig parse_log_options(std::vector<std::string>& args,
                            const std::function<bool(std::string_view)>& is_tool_argument) {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    std::vector<std::string> remaining;
    remaining.reserve(args.size());

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--") {
            // Everything after the terminator belongs to the tool.
            remaining.insert(remaining.end(), args.begin() + static_cast<std::ptrdiff_t>(i),
                             args.end());
            break;
        }

        if (is_tool_argument && is_tool_argument(arg)) {
            remaining.push_back(arg);
        } else if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            std::string fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            if (v_count == 0)
                v_count = 1;
        } else if (is_verbosity_flag(arg)) {
            int count = static_cast<int>(arg.size() - 1);
            if (count > v_count)
                v_count = count;
        } else {
            remaining.push_back(arg);
        }
    }

    // -v/-vv/-vvv only apply without an explicit --log-level
    if (!has_cli_level && v_count > 0) {
        if (v_count >= 3) {
            config.level = LogLevel::Trace;
        } else if (v_count == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("CLTK_LOG");
        std::string env_str = env_log ? env_log : "";
        if (!env_str.empty()) {
            // "module=level,..." and "a,b" are filters, anything else is a level
            if (env_str.find('=') != std::string::npos ||
                env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    args = std::move(remaining);
    return config;
}

} // namespace cltk::log
