//! # Error Types
//!
//! Exceptions that end a lifecycle step. They are caught at the lifecycle
//! boundary (construction or the runner's driver), reported through
//! `tool::report_error()` and turned into a failing exit status.
//!
//! | Type                       | Thrown by                                  |
//! |----------------------------|--------------------------------------------|
//! | `args::ArgumentParserError`| Malformed, unknown or missing arguments    |
//! | `BindingError`             | Binder bodies rejecting a parsed value     |
//! | `DiagnosticsReportedError` | The runner, when error diagnostics exist   |
//!
//! Tools derive their own fatal conditions from `Error`.

#ifndef CLTK_ERROR_HPP
#define CLTK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace cltk {

/// Base class of every error cltk reports.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A parsed value could not be stored into the options struct.
class BindingError : public Error {
public:
    using Error::Error;
};

/// The run finished normally but error diagnostics were recorded.
/// Reporting it prints nothing: the diagnostics are already printed.
class DiagnosticsReportedError : public Error {
public:
    DiagnosticsReportedError() : Error("diagnostics reported errors") {}
};

} // namespace cltk

#endif // CLTK_ERROR_HPP
