//! # CLI Tool Dispatcher
//!
//! ```text
//! cltk_main()
//!   ├─ (no arguments)  → print_usage()
//!   ├─ --help, -h      → print_usage()
//!   ├─ --version, -V   → print_version()
//!   ├─ repeat          → run_repeat()
//!   ├─ pwd             → run_pwd()
//!   └─ anything else   → "unknown tool" + did-you-mean
//! ```
//!
//! Tool runs never return here: they end through the exit seam with 0 or 1.

#include "commands/cmd_pwd.hpp"
#include "commands/cmd_repeat.hpp"
#include "diag/diagnostics.hpp"
#include "driver.hpp"
#include "log/log.hpp"
#include "utils.hpp"

namespace cltk::cli {

int dispatch(const std::vector<std::string>& args, tool::ToolContext& context) {
    if (args.empty()) {
        print_usage(context.out());
        return 0;
    }

    const std::string& command = args.front();
    std::vector<std::string> tool_args(args.begin() + 1, args.end());

    if (command == "--help" || command == "-h") {
        print_usage(context.out());
        return 0;
    }

    if (command == "--version" || command == "-V") {
        print_version(context.out());
        return 0;
    }

    CLTK_LOG_INFO("cli", "dispatching tool '" << command << "'");

    if (command == RepeatTool::info().name) {
        run_repeat(std::move(tool_args), context);
    }

    if (command == PwdTool::info().name) {
        run_pwd(std::move(tool_args), context);
    }

    std::vector<std::string> notes;
    std::string suggestion = diag::find_similar(command, tool_names());
    if (!suggestion.empty()) {
        notes.push_back("did you mean '" + suggestion + "'?");
    }
    notes.push_back("run '" + context.host_program() + " --help' for the list of tools");
    context.diagnostics().engine().error("unknown tool '" + command + "'", std::move(notes));
    return 1;
}

} // namespace cltk::cli

int cltk_main(int argc, char* argv[]) {
    return cltk::cli::dispatch(cltk::cli::collect_args(argc, argv, 1),
                               cltk::tool::ToolContext::process());
}
