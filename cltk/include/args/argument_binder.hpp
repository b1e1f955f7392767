//! # Argument Binder
//!
//! Maps the typed values of a `ParseResult` onto fields of a tool's options
//! struct. Bindings are registered while the schema is defined and replayed
//! by `fill()` after parsing succeeds.
//!
//! ```cpp
//! binder.bind(count, &RepeatOptions::count);
//! binder.bind(words, [](RepeatOptions& o, std::vector<std::string> w) {
//!     o.words = std::move(w);
//! });
//! ```

#ifndef CLTK_ARGS_ARGUMENT_BINDER_HPP
#define CLTK_ARGS_ARGUMENT_BINDER_HPP

#include "args/argument_parser.hpp"

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace cltk::args {

template <typename Options> class ArgumentBinder {
public:
    /// Store the option's value into `field` when it was given.
    template <typename T> void bind(const OptionArgument<T>& arg, T Options::*field) {
        bind_value<T>(arg, [field](Options& options, T value) { options.*field = std::move(value); });
    }

    template <typename T> void bind(const PositionalArgument<T>& arg, T Options::*field) {
        bind_value<T>(arg, [field](Options& options, T value) { options.*field = std::move(value); });
    }

    /// Run `body` with the option's value when it was given. `body` may
    /// throw `BindingError` to reject the value.
    template <typename T>
    void bind(const OptionArgument<T>& arg,
              std::type_identity_t<std::function<void(Options&, T)>> body) {
        bind_value<T>(arg, std::move(body));
    }

    template <typename T>
    void bind(const PositionalArgument<T>& arg,
              std::type_identity_t<std::function<void(Options&, T)>> body) {
        bind_value<T>(arg, std::move(body));
    }

    /// Run `body` with both values when at least one of them was given.
    template <typename T, typename U>
    void bind(const OptionArgument<T>& first, const OptionArgument<U>& second,
              std::type_identity_t<std::function<void(Options&, std::optional<T>, std::optional<U>)>>
                  body) {
        bodies_.push_back([first, second, body = std::move(body)](const ParseResult& result,
                                                                   Options& options) {
            std::optional<T> a = result.get(first);
            std::optional<U> b = result.get(second);
            if (a || b) {
                body(options, std::move(a), std::move(b));
            }
        });
    }

    /// Apply every binding, in registration order.
    void fill(const ParseResult& result, Options& options) const {
        for (const auto& body : bodies_) {
            body(result, options);
        }
    }

    size_t size() const {
        return bodies_.size();
    }

private:
    using Body = std::function<void(const ParseResult&, Options&)>;

    template <typename T, typename Handle>
    void bind_value(const Handle& arg, std::function<void(Options&, T)> body) {
        bodies_.push_back([arg, body = std::move(body)](const ParseResult& result,
                                                        Options& options) {
            if (std::optional<T> value = result.get(arg)) {
                body(options, std::move(*value));
            }
        });
    }

    std::vector<Body> bodies_;
};

} // namespace cltk::args

#endif // CLTK_ARGS_ARGUMENT_BINDER_HPP
