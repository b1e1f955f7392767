//! # cltk Driver Interface
//!
//! `cltk_main()` dispatches to the tool named by argv[1].

#pragma once

#include "tool/tool_context.hpp"

#include <string>
#include <vector>

/// Process entry point. Uses the process-wide tool context.
int cltk_main(int argc, char* argv[]);

namespace cltk::cli {

/// Dispatch `args` (argv without the program name) against `context`.
/// Returns the exit code for help, version and unknown-tool outcomes. A known
/// tool ends through the context's exit seam and does not return.
int dispatch(const std::vector<std::string>& args, tool::ToolContext& context);

} // namespace cltk::cli
