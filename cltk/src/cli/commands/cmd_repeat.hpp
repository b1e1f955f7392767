//! # repeat Tool
//!
//! `cltk repeat --count=<n> [--separator=<s>] [--quiet-info] <words...>`
//!
//! Prints the words joined by the separator, once per line, `count` times on
//! standard output. A header line describing the run goes to the lifecycle
//! stream, which `--quiet-info` moves to standard error.

#pragma once

#include "error.hpp"
#include "tool/tool_context.hpp"
#include "tool/tool_lifecycle.hpp"
#include "tool/tool_runner.hpp"

#include <string>
#include <vector>

namespace cltk::cli {

struct RepeatOptions {
    int count = 1;
    std::string separator = " ";
    bool quiet_info = false;
    std::vector<std::string> words;
};

/// Fatal conditions of the repeat tool.
class RepeatError : public Error {
public:
    enum class Kind { NoWords };

    explicit RepeatError(Kind kind);

    Kind kind() const {
        return kind_;
    }

private:
    static std::string describe(Kind kind);

    Kind kind_;
};

class RepeatDefinition : public tool::ArgumentDefinition<RepeatOptions> {
public:
    void define_arguments(args::ArgumentParser& parser,
                          args::ArgumentBinder<RepeatOptions>& binder) const override;
    void postprocess(const args::ParseResult& result,
                     diag::DiagnosticsEngine& diagnostics) const override;
};

class RepeatTool : public tool::ToolRunner<RepeatOptions> {
public:
    explicit RepeatTool(std::vector<std::string> args,
                        tool::ToolContext& context = tool::ToolContext::process());

    static tool::ToolInfo info();

    tool::ToolLifecycle<RepeatOptions>& lifecycle() override {
        return lifecycle_;
    }

protected:
    void run_impl() override;

private:
    RepeatDefinition definition_;
    tool::ToolLifecycle<RepeatOptions> lifecycle_;
};

[[noreturn]] void run_repeat(std::vector<std::string> args, tool::ToolContext& context);

} // namespace cltk::cli
