#include "cmd_pwd.hpp"

namespace cltk::cli {

// Takes no arguments; anything given is rejected by the parser.
void PwdDefinition::define_arguments(args::ArgumentParser& /*parser*/,
                                     args::ArgumentBinder<PwdOptions>& /*binder*/) const {}

PwdTool::PwdTool(std::vector<std::string> args, tool::ToolContext& context)
    : lifecycle_(definition_, info(), std::move(args), context) {}

tool::ToolInfo PwdTool::info() {
    return {"pwd", "", "Print the working directory", std::nullopt};
}

void PwdTool::run_impl() {
    out() << lifecycle_.original_working_directory().string() << "\n";
}

void run_pwd(std::vector<std::string> args, tool::ToolContext& context) {
    PwdTool tool(std::move(args), context);
    tool.run();
}

} // namespace cltk::cli
