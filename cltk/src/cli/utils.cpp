#include "utils.hpp"

#include "commands/cmd_pwd.hpp"
#include "commands/cmd_repeat.hpp"
#include "common.hpp"

#include <iomanip>

namespace cltk::cli {

std::vector<std::string> collect_args(int argc, char* argv[], int first) {
    std::vector<std::string> args;
    for (int i = first; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return args;
}

std::vector<std::string> tool_names() {
    return {RepeatTool::info().name, PwdTool::info().name};
}

void print_usage(std::ostream& out) {
    out << "cltk " << VERSION << "\n\n";
    out << "Usage: cltk <tool> [options] [arguments]\n\n";
    out << "Tools:\n";
    for (const auto& info : {RepeatTool::info(), PwdTool::info()}) {
        out << "  " << std::left << std::setw(10) << info.name << info.overview << "\n";
    }
    out << "\nOptions:\n";
    out << "  --help, -h            Show this help\n";
    out << "  --version, -V         Show version\n";
    out << "\nLogging (accepted by every tool):\n";
    out << "  --log-level=<level>   trace, debug, info, warn, error, off\n";
    out << "  --log-filter=<spec>   Per-module levels, e.g. args=trace,*=warn\n";
    out << "  --log-file=<path>     Also write log records to a file\n";
    out << "  --log-format=<fmt>    text or json\n";
    out << "  -v, -vv, -vvv        Info, debug, trace\n";
    out << "  -q, --quiet           Errors only\n";
}

void print_version(std::ostream& out) {
    out << "cltk " << VERSION << "\n";
}

} // namespace cltk::cli
