#include "cmd_repeat.hpp"

#include "log/log.hpp"

namespace cltk::cli {

// ============================================================================
// RepeatError
// ============================================================================

RepeatError::RepeatError(Kind kind) : Error(describe(kind)), kind_(kind) {}

std::string RepeatError::describe(Kind kind) {
    switch (kind) {
    case Kind::NoWords:
        return "no words to repeat";
    }
    return "repeat failed";
}

// ============================================================================
// Arguments
// ============================================================================

void RepeatDefinition::define_arguments(args::ArgumentParser& parser,
                                        args::ArgumentBinder<RepeatOptions>& binder) const {
    auto count =
        parser.add_option<int>("--count", "-c", "Number of times to print the words", true);
    auto separator =
        parser.add_option<std::string>("--separator", "-s", "Text placed between words");
    auto quiet_info =
        parser.add_option<bool>("--quiet-info", "", "Write the run header to standard error");
    auto words =
        parser.add_positional<std::vector<std::string>>("words", "Words to print", true);

    binder.bind(count, &RepeatOptions::count);
    binder.bind(separator, &RepeatOptions::separator);
    binder.bind(quiet_info, &RepeatOptions::quiet_info);
    binder.bind(words, &RepeatOptions::words);
}

void RepeatDefinition::postprocess(const args::ParseResult& result,
                                   diag::DiagnosticsEngine& diagnostics) const {
    std::optional<int> count = result.value<int>("--count");
    if (count && *count < 1) {
        diagnostics.error("--count must be at least 1, got " + std::to_string(*count));
    }
}

// ============================================================================
// Tool
// ============================================================================

RepeatTool::RepeatTool(std::vector<std::string> args, tool::ToolContext& context)
    : lifecycle_(definition_, info(), std::move(args), context) {}

tool::ToolInfo RepeatTool::info() {
    return {"repeat", "--count=<n> [--separator=<s>] [--quiet-info] <words...>",
            "Print words a number of times", std::nullopt};
}

void RepeatTool::run_impl() {
    const RepeatOptions& opts = options();
    if (opts.quiet_info) {
        redirect_stdout_to_stderr();
    }
    if (opts.words.empty()) {
        throw RepeatError(RepeatError::Kind::NoWords);
    }
    if (opts.count < 1) {
        return; // reported by postprocess
    }

    out() << "repeating " << opts.words.size() << " word(s) " << opts.count << " time(s)\n";

    std::string line;
    for (size_t i = 0; i < opts.words.size(); ++i) {
        if (i > 0)
            line += opts.separator;
        line += opts.words[i];
    }

    std::ostream& data = lifecycle_.context().out();
    for (int i = 0; i < opts.count; ++i) {
        data << line << "\n";
    }
    CLTK_LOG_DEBUG("repeat", "printed " << opts.count << " line(s)");
}

void run_repeat(std::vector<std::string> args, tool::ToolContext& context) {
    RepeatTool tool(std::move(args), context);
    tool.run();
}

} // namespace cltk::cli
