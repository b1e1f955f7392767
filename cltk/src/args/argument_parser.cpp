//! # Argument Parser Implementation
//!
//! Value conversion for the built-in argument kinds and the two-pass parse:
//! the first pass collects raw strings per argument, the second converts them
//! to typed values.

#include "args/argument_parser.hpp"

#include "diag/diagnostics.hpp"
#include "log/log.hpp"

#include <charconv>
#include <cmath>
#include <stdexcept>

namespace cltk::args {

// ============================================================================
// Value Kinds
// ============================================================================

namespace {

/// Start of the number for std::from_chars, which rejects a leading '+'.
/// Returns nullptr for an empty text or a sign following '+'.
const char* skip_plus_sign(std::string_view text) {
    if (text.empty())
        return nullptr;
    const char* begin = text.data();
    if (*begin == '+') {
        ++begin;
        if (begin == text.data() + text.size() || *begin == '+' || *begin == '-')
            return nullptr;
    }
    return begin;
}

template <typename T> Result<T, ConversionError> parse_integer(std::string_view text) {
    T value{};
    const char* begin = skip_plus_sign(text);
    const char* end = text.data() + text.size();
    if (!begin) {
        return ConversionError{"an integer"};
    }
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return ConversionError{"an integer"};
    }
    return value;
}

/// "-5" and "-0.5" are values, not short options.
bool looks_like_negative_number(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-')
        return false;
    char c = arg[1];
    return (c >= '0' && c <= '9') || c == '.';
}

bool looks_like_option(std::string_view arg) {
    return arg.size() > 1 && arg[0] == '-' && !looks_like_negative_number(arg);
}

} // namespace

Result<bool, ConversionError> ArgumentKind<bool>::convert(std::string_view text) {
    if (text == "true" || text == "1" || text == "yes")
        return true;
    if (text == "false" || text == "0" || text == "no")
        return false;
    return ConversionError{"true or false"};
}

Result<int, ConversionError> ArgumentKind<int>::convert(std::string_view text) {
    return parse_integer<int>(text);
}

Result<int64_t, ConversionError> ArgumentKind<int64_t>::convert(std::string_view text) {
    return parse_integer<int64_t>(text);
}

Result<double, ConversionError> ArgumentKind<double>::convert(std::string_view text) {
    double value = 0.0;
    const char* begin = skip_plus_sign(text);
    const char* end = text.data() + text.size();
    if (!begin) {
        return ConversionError{"a number"};
    }
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end || !std::isfinite(value)) {
        return ConversionError{"a number"};
    }
    return value;
}

Result<std::filesystem::path, ConversionError>
ArgumentKind<std::filesystem::path>::convert(std::string_view text) {
    if (text.empty()) {
        return ConversionError{"a path"};
    }
    return std::filesystem::path(text).lexically_normal();
}

// ============================================================================
// ArgumentParser
// ============================================================================

ArgumentParser::ArgumentParser(std::string command_name, std::string usage, std::string overview,
                               std::optional<std::string> see_also)
    : command_name_(std::move(command_name)), usage_(std::move(usage)),
      overview_(std::move(overview)), see_also_(std::move(see_also)) {}

std::string ArgumentParser::usage_line() const {
    return "usage: " + command_name_ + " " + usage_;
}

std::vector<std::string> ArgumentParser::option_names() const {
    std::vector<std::string> names;
    names.reserve(options_.size());
    for (const auto& spec : options_) {
        names.push_back(spec.name);
    }
    return names;
}

std::string ArgumentParser::describe_failure(const std::string& text,
                                             const ConversionError& error) {
    return "'" + text + "' (expected " + error.expected + ")";
}

void ArgumentParser::register_spec(ArgumentSpec spec) {
    auto clashes = [&spec](const ArgumentSpec& other) {
        return other.name == spec.name ||
               (!spec.short_name.empty() && other.short_name == spec.short_name);
    };
    for (const auto& existing : options_) {
        if (clashes(existing)) {
            throw std::invalid_argument("argument '" + spec.name + "' is defined twice");
        }
    }
    for (const auto& existing : positionals_) {
        if (clashes(existing)) {
            throw std::invalid_argument("argument '" + spec.name + "' is defined twice");
        }
    }

    if (spec.positional) {
        if (!positionals_.empty() && positionals_.back().is_list) {
            throw std::invalid_argument("positional '" + spec.name +
                                        "' follows a list positional that takes every value");
        }
        positionals_.push_back(std::move(spec));
    } else {
        options_.push_back(std::move(spec));
    }
}

const ArgumentParser::ArgumentSpec* ArgumentParser::find_option(std::string_view name) const {
    for (const auto& spec : options_) {
        if (spec.name == name || (!spec.short_name.empty() && spec.short_name == name)) {
            return &spec;
        }
    }
    return nullptr;
}

ParseResult ArgumentParser::parse(const std::vector<std::string>& args) const {
    using Kind = ArgumentParserError::Kind;

    CLTK_LOG_DEBUG("args", "parsing " << args.size() << " argument(s) for '" << command_name_
                                      << "'");

    std::unordered_map<std::string, std::vector<std::string>> raw;
    std::vector<std::string> positional_values;
    bool options_ended = false;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (options_ended || !looks_like_option(arg)) {
            positional_values.push_back(arg);
            continue;
        }
        if (arg == "--") {
            options_ended = true;
            continue;
        }

        std::string name = arg;
        std::optional<std::string> inline_value;
        size_t eq = arg.find('=');
        if (eq != std::string::npos) {
            name = arg.substr(0, eq);
            inline_value = arg.substr(eq + 1);
        }

        const ArgumentSpec* spec = find_option(name);
        if (!spec) {
            std::string suggestion = diag::find_similar(name, option_names(), 2);
            throw ArgumentParserError(Kind::UnknownOption, "unknown option " + name, suggestion);
        }

        std::string value;
        if (!spec->takes_value) {
            value = inline_value.value_or("true");
        } else if (inline_value) {
            value = *inline_value;
        } else if (i + 1 < args.size() && !looks_like_option(args[i + 1])) {
            value = args[++i];
        } else {
            throw ArgumentParserError(Kind::ExpectedValue, "option " + spec->name +
                                                               " requires a value");
        }

        auto& slot = raw[spec->name];
        if (!slot.empty() && !spec->is_list) {
            throw ArgumentParserError(Kind::DuplicateArgument,
                                      "option " + spec->name + " was given more than once");
        }
        slot.push_back(std::move(value));
    }

    size_t next_value = 0;
    for (const auto& spec : positionals_) {
        if (next_value >= positional_values.size())
            break;
        auto& slot = raw[spec.name];
        if (spec.is_list) {
            slot.assign(positional_values.begin() + static_cast<std::ptrdiff_t>(next_value),
                        positional_values.end());
            next_value = positional_values.size();
        } else {
            slot.push_back(positional_values[next_value++]);
        }
    }
    if (next_value < positional_values.size()) {
        throw ArgumentParserError(Kind::UnexpectedArgument,
                                  "unexpected argument '" + positional_values[next_value] + "'");
    }

    for (const auto& spec : options_) {
        if (spec.required && !raw.contains(spec.name)) {
            throw ArgumentParserError(Kind::MissingRequired,
                                      "missing required option " + spec.name);
        }
    }
    for (const auto& spec : positionals_) {
        if (spec.required && !raw.contains(spec.name)) {
            throw ArgumentParserError(Kind::MissingRequired,
                                      "missing expected argument <" + spec.name + ">");
        }
    }

    ParseResult result;
    auto convert_all = [&](const std::vector<ArgumentSpec>& specs) {
        for (const auto& spec : specs) {
            auto it = raw.find(spec.name);
            if (it == raw.end())
                continue;
            auto converted = spec.convert(it->second);
            if (is_err(converted)) {
                throw ArgumentParserError(Kind::InvalidValue, "invalid value " +
                                                                  unwrap_err(converted) + " for " +
                                                                  spec.name);
            }
            result.values_.emplace(spec.name, std::move(std::get<std::any>(converted)));
        }
    };
    convert_all(options_);
    convert_all(positionals_);

    CLTK_LOG_TRACE("args", "parsed " << result.size() << " value(s)");
    return result;
}

} // namespace cltk::args
