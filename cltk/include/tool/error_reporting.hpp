//! # Error Reporting
//!
//! The one path that turns a caught error into diagnostics.
//!
//! | Error                      | Printed as                                 |
//! |----------------------------|--------------------------------------------|
//! | `DiagnosticsReportedError` | nothing (already printed)                  |
//! | `args::ArgumentParserError`| error + "did you mean" note + usage note   |
//! | any `std::exception`       | error with `what()`                        |
//! | anything else              | "unknown error"                            |

#ifndef CLTK_TOOL_ERROR_REPORTING_HPP
#define CLTK_TOOL_ERROR_REPORTING_HPP

#include "diag/diagnostics.hpp"

#include <exception>
#include <string>

namespace cltk::tool {

/// Report `error` through `diagnostics`. `usage_line` is attached as a note to
/// argument errors when not empty.
void report_error(std::exception_ptr error, diag::DiagnosticsEngine& diagnostics,
                  const std::string& usage_line = "");

} // namespace cltk::tool

#endif // CLTK_TOOL_ERROR_REPORTING_HPP
