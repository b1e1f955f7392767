//! # Tool Lifecycle
//!
//! Construction half of every cltk tool: capture the working directory, parse
//! and bind arguments, wire diagnostics. Construction is all-or-nothing. It
//! either yields fully bound options or ends the process with a failing
//! status through the context's exit seam.
//!
//! ## Construction Steps
//!
//! ```text
//! ToolLifecycle(definition, info, args, context)
//!   ├─ capture cwd            → missing: error diagnostic, exit(Failure)
//!   ├─ build parser           → "<host> <tool>"
//!   ├─ define_arguments()     ─┐
//!   ├─ strip logging options   │  (options the tool declares are kept)
//!   ├─ parser.parse(args)      ├─ throws: report_error(), exit(Failure)
//!   ├─ postprocess()           │
//!   └─ binder.fill(options)   ─┘
//! ```

#ifndef CLTK_TOOL_TOOL_LIFECYCLE_HPP
#define CLTK_TOOL_TOOL_LIFECYCLE_HPP

#include "args/argument_binder.hpp"
#include "args/argument_parser.hpp"
#include "diag/diagnostics.hpp"
#include "log/log.hpp"
#include "tool/error_reporting.hpp"
#include "tool/execution_status.hpp"
#include "tool/process_exit.hpp"
#include "tool/tool_context.hpp"

#include <exception>
#include <filesystem>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace cltk::tool {

/// Name and help metadata of one tool.
struct ToolInfo {
    std::string name;
    std::string usage;
    std::string overview;
    std::optional<std::string> see_also;
};

/// The argument schema of a tool producing `Options`.
template <typename Options> class ArgumentDefinition {
public:
    virtual ~ArgumentDefinition() = default;

    /// Register options and positionals on `parser` and their bindings on
    /// `binder`.
    virtual void define_arguments(args::ArgumentParser& parser,
                                  args::ArgumentBinder<Options>& binder) const = 0;

    /// Semantic checks on the parse result. May emit diagnostics or throw.
    virtual void postprocess(const args::ParseResult& /*result*/,
                             diag::DiagnosticsEngine& /*diagnostics*/) const {}
};

template <typename Options> class ToolLifecycle {
    static_assert(std::is_default_constructible_v<Options>,
                  "tool options must be default-constructible");

public:
    ToolLifecycle(const ArgumentDefinition<Options>& definition, const ToolInfo& info,
                  std::vector<std::string> args, ToolContext& context = ToolContext::process())
        : context_(&context), out_(&context.out()),
          original_working_directory_(capture_working_directory()),
          parser_(context.host_program() + " " + info.name, info.usage, info.overview,
                  info.see_also),
          options_(parse_and_bind(definition, std::move(args))) {
        CLTK_LOG_DEBUG("lifecycle", "'" << parser_.command_name() << "' initialized in "
                                        << original_working_directory_.string());
    }

    ToolLifecycle(const ToolLifecycle&) = delete;
    ToolLifecycle& operator=(const ToolLifecycle&) = delete;

    const Options& options() const {
        return options_;
    }

    /// Working directory at the time the tool started.
    const std::filesystem::path& original_working_directory() const {
        return original_working_directory_;
    }

    const args::ArgumentParser& parser() const {
        return parser_;
    }

    diag::DiagnosticsEngine& diagnostics() const {
        return context_->diagnostics().engine();
    }

    /// Stream for the tool's plain output. Standard output until
    /// `redirect_stdout_to_stderr()` is called.
    std::ostream& out() const {
        return *out_;
    }

    ToolContext& context() const {
        return *context_;
    }

    ExecutionStatus execution_status() const {
        return status_;
    }

    /// Record an unrecovered error. There is no way back to Success.
    void mark_failed() {
        status_ = ExecutionStatus::Failure;
    }

    /// Send both the plain output stream and diagnostics to standard error,
    /// keeping standard output free for data. Permanent for the run.
    void redirect_stdout_to_stderr() {
        out_ = &context_->err();
        context_->diagnostics().redirect(context_->err());
        CLTK_LOG_DEBUG("lifecycle", "plain output redirected to the error stream");
    }

    bool is_redirected() const {
        return out_ == &context_->err();
    }

    [[noreturn]] void exit(ExecutionStatus status) const {
        context_->exit_with(status);
    }

private:
    std::filesystem::path capture_working_directory() const {
        std::optional<std::filesystem::path> cwd = context_->file_system().current_working_directory();
        if (!cwd) {
            diagnostics().error("couldn't determine the current working directory");
            context_->exit_with(ExecutionStatus::Failure);
        }
        return *cwd;
    }

    Options parse_and_bind(const ArgumentDefinition<Options>& definition,
                           std::vector<std::string> args) {
        try {
            args::ArgumentBinder<Options> binder;
            definition.define_arguments(parser_, binder);

            configure_logging(args);

            args::ParseResult result = parser_.parse(args);
            definition.postprocess(result, diagnostics());

            Options options;
            binder.fill(result, options);
            return options;
        } catch (const ExitInterrupted&) {
            throw;
        } catch (...) {
            report_error(std::current_exception(), diagnostics(), parser_.usage_line());
        }
        context_->exit_with(ExecutionStatus::Failure);
    }

    /// Remove the global logging options from `args`, leaving any the tool
    /// declared itself, and apply them to the logger.
    void configure_logging(std::vector<std::string>& args) const {
        log::LogConfig log_config = log::parse_log_options(args, [this](std::string_view arg) {
            return parser_.has_option(arg.substr(0, arg.find('=')));
        });
        if (context_->configures_logging()) {
            log::Logger::init(log_config);
        }
    }

    ToolContext* context_;
    std::ostream* out_;
    ExecutionStatus status_ = ExecutionStatus::Success;
    std::filesystem::path original_working_directory_;
    args::ArgumentParser parser_;
    Options options_;
};

} // namespace cltk::tool

#endif // CLTK_TOOL_TOOL_LIFECYCLE_HPP
