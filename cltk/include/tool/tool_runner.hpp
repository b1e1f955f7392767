//! # Tool Runner
//!
//! Execution half of a cltk tool. Concrete tools own a `ToolLifecycle`,
//! implement `run_impl()` and call `run()` from their entry point:
//!
//! ```cpp
//! class RepeatTool : public ToolRunner<RepeatOptions> {
//!     ToolLifecycle<RepeatOptions>& lifecycle() override { return lifecycle_; }
//!     void run_impl() override { ... }
//! };
//!
//! RepeatTool(args).run(); // never returns
//! ```
//!
//! `execute()` returns the final status instead of exiting, for hosts that
//! dispatch to several tools.

#ifndef CLTK_TOOL_TOOL_RUNNER_HPP
#define CLTK_TOOL_TOOL_RUNNER_HPP

#include "error.hpp"
#include "log/log.hpp"
#include "tool/error_reporting.hpp"
#include "tool/execution_status.hpp"
#include "tool/process_exit.hpp"
#include "tool/tool_lifecycle.hpp"

#include <exception>
#include <ostream>

namespace cltk::tool {

template <typename Options> class ToolRunner {
public:
    virtual ~ToolRunner() = default;

    /// The lifecycle built by the concrete tool's constructor.
    virtual ToolLifecycle<Options>& lifecycle() = 0;

    /// The tool's work. Errors may be thrown or emitted as diagnostics.
    virtual void run_impl() = 0;

    /// Run the tool and fold every outcome into a status. Error diagnostics
    /// recorded during the run count as failure even if nothing was thrown.
    ExecutionStatus execute() {
        ToolLifecycle<Options>& base = lifecycle();
        try {
            run_impl();
            if (base.diagnostics().has_errors()) {
                throw DiagnosticsReportedError();
            }
        } catch (const ExitInterrupted&) {
            // run_impl() ended the run through the exit seam.
            throw;
        } catch (...) {
            base.mark_failed();
            report_error(std::current_exception(), base.diagnostics(), base.parser().usage_line());
        }

        CLTK_LOG_DEBUG("runner", "'" << base.parser().command_name() << "' finished with "
                                     << status_name(base.execution_status()));
        return base.execution_status();
    }

    /// Run the tool and end the process with its status.
    [[noreturn]] void run() {
        ExecutionStatus status = execute();
        lifecycle().exit(status);
    }

protected:
    const Options& options() {
        return lifecycle().options();
    }

    diag::DiagnosticsEngine& diagnostics() {
        return lifecycle().diagnostics();
    }

    std::ostream& out() {
        return lifecycle().out();
    }

    void redirect_stdout_to_stderr() {
        lifecycle().redirect_stdout_to_stderr();
    }
};

} // namespace cltk::tool

#endif // CLTK_TOOL_TOOL_RUNNER_HPP
