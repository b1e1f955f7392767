//! # Argument Parser
//!
//! Schema-driven parser for a tool's argument list.
//!
//! ## Grammar
//!
//! | Form               | Meaning                                        |
//! |--------------------|------------------------------------------------|
//! | `--name=value`     | Option with an inline value                    |
//! | `--name value`     | Option with a separate value                   |
//! | `-n value`         | Short alias                                    |
//! | `--flag`           | Boolean option, no value                       |
//! | `--`               | Everything after it is positional              |
//! | anything else      | Positional argument                            |
//!
//! ## Usage
//!
//! ```cpp
//! ArgumentParser parser("cltk repeat", "--count=<n> <words...>", "Repeat words");
//! auto count = parser.add_option<int>("--count", "-c", "Repetitions", true);
//! auto words = parser.add_positional<std::vector<std::string>>("words", "Words to print");
//! ParseResult result = parser.parse(args);
//! std::optional<int> n = result.get(count);
//! ```
//!
//! Every failure throws `ArgumentParserError`.

#ifndef CLTK_ARGS_ARGUMENT_PARSER_HPP
#define CLTK_ARGS_ARGUMENT_PARSER_HPP

#include "common.hpp"
#include "error.hpp"

#include <any>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cltk::args {

// ============================================================================
// Errors
// ============================================================================

class ArgumentParserError : public Error {
public:
    enum class Kind {
        UnknownOption,      ///< "--cout" when only "--count" exists
        ExpectedValue,      ///< "--count" at the end of the list
        InvalidValue,       ///< "--count=abc"
        MissingRequired,    ///< Required option or positional not given
        UnexpectedArgument, ///< More positionals than the schema accepts
        DuplicateArgument,  ///< Single-valued option given twice
    };

    ArgumentParserError(Kind kind, const std::string& message, std::string suggestion = {})
        : Error(message), kind_(kind), suggestion_(std::move(suggestion)) {}

    Kind kind() const {
        return kind_;
    }

    /// Closest known option name for UnknownOption, empty otherwise.
    const std::string& suggestion() const {
        return suggestion_;
    }

private:
    Kind kind_;
    std::string suggestion_;
};

// ============================================================================
// Value Kinds
// ============================================================================

struct ConversionError {
    std::string expected; // e.g. "an integer"
};

/// How raw argument text converts to a value of type T.
///
/// `takes_value` is false only for boolean flags. `is_list` marks kinds that
/// accumulate every occurrence.
template <typename T> struct ArgumentKind;

template <> struct ArgumentKind<bool> {
    static constexpr bool takes_value = false;
    static constexpr bool is_list = false;
    static Result<bool, ConversionError> convert(std::string_view text);
};

template <> struct ArgumentKind<int> {
    static constexpr bool takes_value = true;
    static constexpr bool is_list = false;
    static Result<int, ConversionError> convert(std::string_view text);
};

template <> struct ArgumentKind<int64_t> {
    static constexpr bool takes_value = true;
    static constexpr bool is_list = false;
    static Result<int64_t, ConversionError> convert(std::string_view text);
};

template <> struct ArgumentKind<double> {
    static constexpr bool takes_value = true;
    static constexpr bool is_list = false;
    static Result<double, ConversionError> convert(std::string_view text);
};

template <> struct ArgumentKind<std::string> {
    static constexpr bool takes_value = true;
    static constexpr bool is_list = false;
    static Result<std::string, ConversionError> convert(std::string_view text) {
        return std::string(text);
    }
};

template <> struct ArgumentKind<std::filesystem::path> {
    static constexpr bool takes_value = true;
    static constexpr bool is_list = false;
    static Result<std::filesystem::path, ConversionError> convert(std::string_view text);
};

template <typename T> struct ArgumentKind<std::vector<T>> {
    static_assert(ArgumentKind<T>::takes_value, "list arguments need a value-taking element");
    static constexpr bool takes_value = true;
    static constexpr bool is_list = true;
    using Element = T;
};

// ============================================================================
// Typed Handles
// ============================================================================

/// Handle returned by `ArgumentParser::add_option<T>()`.
template <typename T> class OptionArgument {
public:
    const std::string& name() const {
        return name_;
    }

private:
    friend class ArgumentParser;
    explicit OptionArgument(std::string name) : name_(std::move(name)) {}
    std::string name_;
};

/// Handle returned by `ArgumentParser::add_positional<T>()`.
template <typename T> class PositionalArgument {
public:
    const std::string& name() const {
        return name_;
    }

private:
    friend class ArgumentParser;
    explicit PositionalArgument(std::string name) : name_(std::move(name)) {}
    std::string name_;
};

// ============================================================================
// Parse Result
// ============================================================================

/// Typed values produced by one `ArgumentParser::parse()` call.
class ParseResult {
public:
    template <typename T> std::optional<T> get(const OptionArgument<T>& arg) const {
        return get_value<T>(arg.name());
    }

    template <typename T> std::optional<T> get(const PositionalArgument<T>& arg) const {
        return get_value<T>(arg.name());
    }

    /// Value of the argument registered as `name`, looked up without a
    /// handle. `T` must be the type the argument was registered with.
    template <typename T> std::optional<T> value(const std::string& name) const {
        return get_value<T>(name);
    }

    /// True if the argument was present on the command line.
    bool has(const std::string& name) const {
        return values_.contains(name);
    }

    size_t size() const {
        return values_.size();
    }

private:
    friend class ArgumentParser;

    template <typename T> std::optional<T> get_value(const std::string& name) const {
        auto it = values_.find(name);
        if (it == values_.end())
            return std::nullopt;
        return std::any_cast<T>(it->second);
    }

    std::unordered_map<std::string, std::any> values_;
};

// ============================================================================
// Argument Parser
// ============================================================================

class ArgumentParser {
public:
    ArgumentParser(std::string command_name, std::string usage, std::string overview,
                   std::optional<std::string> see_also = std::nullopt);

    /// Register an option. `short_name` may be empty.
    template <typename T>
    OptionArgument<T> add_option(const std::string& name, const std::string& short_name = "",
                                 const std::string& usage = "", bool required = false) {
        ArgumentSpec spec;
        spec.name = name;
        spec.short_name = short_name;
        spec.usage = usage;
        spec.required = required;
        spec.takes_value = ArgumentKind<T>::takes_value;
        spec.is_list = ArgumentKind<T>::is_list;
        spec.convert = make_converter<T>();
        register_spec(std::move(spec));
        return OptionArgument<T>(name);
    }

    /// Register a positional argument. A `std::vector<T>` positional takes
    /// every remaining positional value and must be registered last.
    template <typename T>
    PositionalArgument<T> add_positional(const std::string& name, const std::string& usage = "",
                                         bool optional = false) {
        static_assert(ArgumentKind<T>::takes_value, "a positional argument cannot be a flag");
        ArgumentSpec spec;
        spec.name = name;
        spec.usage = usage;
        spec.positional = true;
        spec.required = !optional;
        spec.is_list = ArgumentKind<T>::is_list;
        spec.convert = make_converter<T>();
        register_spec(std::move(spec));
        return PositionalArgument<T>(name);
    }

    /// Parse `args` (without the program or tool name) against the schema.
    ParseResult parse(const std::vector<std::string>& args) const;

    const std::string& command_name() const {
        return command_name_;
    }
    const std::string& usage() const {
        return usage_;
    }
    const std::string& overview() const {
        return overview_;
    }
    const std::optional<std::string>& see_also() const {
        return see_also_;
    }

    /// "usage: <command name> <usage>"
    std::string usage_line() const;

    /// Names of all registered options (long form), in registration order.
    std::vector<std::string> option_names() const;

    /// True if `name` is the long or short name of a registered option.
    bool has_option(std::string_view name) const {
        return find_option(name) != nullptr;
    }

private:
    using Converter =
        std::function<Result<std::any, std::string>(const std::vector<std::string>& raw)>;

    struct ArgumentSpec {
        std::string name;
        std::string short_name;
        std::string usage;
        bool positional = false;
        bool required = false;
        bool takes_value = true;
        bool is_list = false;
        Converter convert;
    };

    void register_spec(ArgumentSpec spec);
    const ArgumentSpec* find_option(std::string_view name) const;

    /// Converts the raw strings collected for one argument. The error text
    /// names the first offending value and the expected kind.
    template <typename T> static Converter make_converter() {
        return [](const std::vector<std::string>& raw) -> Result<std::any, std::string> {
            if constexpr (ArgumentKind<T>::is_list) {
                using Element = typename ArgumentKind<T>::Element;
                T values;
                values.reserve(raw.size());
                for (const auto& text : raw) {
                    auto converted = ArgumentKind<Element>::convert(text);
                    if (is_err(converted)) {
                        return describe_failure(text, unwrap_err(converted));
                    }
                    values.push_back(std::move(std::get<Element>(converted)));
                }
                return std::any(std::move(values));
            } else {
                auto converted = ArgumentKind<T>::convert(raw.back());
                if (is_err(converted)) {
                    return describe_failure(raw.back(), unwrap_err(converted));
                }
                return std::any(std::move(std::get<T>(converted)));
            }
        };
    }

    static std::string describe_failure(const std::string& text, const ConversionError& error);

    std::string command_name_;
    std::string usage_;
    std::string overview_;
    std::optional<std::string> see_also_;
    std::vector<ArgumentSpec> options_;
    std::vector<ArgumentSpec> positionals_;
};

} // namespace cltk::args

#endif // CLTK_ARGS_ARGUMENT_PARSER_HPP
