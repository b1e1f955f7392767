#pragma once

#include "tool/tool_context.hpp"
#include "tool/tool_lifecycle.hpp"
#include "tool/tool_runner.hpp"

#include <string>
#include <vector>

namespace cltk::cli {

struct PwdOptions {};

class PwdDefinition : public tool::ArgumentDefinition<PwdOptions> {
public:
    void define_arguments(args::ArgumentParser& parser,
                          args::ArgumentBinder<PwdOptions>& binder) const override;
};

/// `cltk pwd`: print the working directory captured at startup.
class PwdTool : public tool::ToolRunner<PwdOptions> {
public:
    explicit PwdTool(std::vector<std::string> args,
                     tool::ToolContext& context = tool::ToolContext::process());

    static tool::ToolInfo info();

    tool::ToolLifecycle<PwdOptions>& lifecycle() override {
        return lifecycle_;
    }

protected:
    void run_impl() override;

private:
    PwdDefinition definition_;
    tool::ToolLifecycle<PwdOptions> lifecycle_;
};

[[noreturn]] void run_pwd(std::vector<std::string> args, tool::ToolContext& context);

} // namespace cltk::cli
