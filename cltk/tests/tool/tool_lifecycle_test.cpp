//! # Tool Lifecycle Tests
//!
//! Construction of a lifecycle: working directory capture, parsing, binding,
//! post-processing and the failure exits.

#include "tool/tool_lifecycle.hpp"
#include "tool_test_support.hpp"

#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace cltk;
using namespace cltk::tool;
using cltk::testing::ExitCalled;
using cltk::testing::TestContext;

namespace {

struct CountOptions {
    int count = 0;
    std::string label;
    bool verbose = false;
};

class CountDefinition : public ArgumentDefinition<CountOptions> {
public:
    void define_arguments(args::ArgumentParser& parser,
                          args::ArgumentBinder<CountOptions>& binder) const override {
        define_calls++;
        auto count = parser.add_option<int>("--count", "-c", "How many", true);
        auto label = parser.add_option<std::string>("--label");
        auto verbose = parser.add_option<bool>("--loud");
        binder.bind(count, &CountOptions::count);
        binder.bind(label, [](CountOptions& options, std::string value) {
            if (value == "forbidden") {
                throw BindingError("label 'forbidden' is reserved");
            }
            options.label = std::move(value);
        });
        binder.bind(verbose, &CountOptions::verbose);
    }

    void postprocess(const args::ParseResult& result,
                     diag::DiagnosticsEngine& diagnostics) const override {
        postprocess_calls++;
        if (warn_on_postprocess) {
            diagnostics.warning("post-processing saw " + std::to_string(result.size()) +
                                " value(s)");
        }
        if (throw_on_postprocess) {
            throw Error("post-processing rejected the arguments");
        }
    }

    mutable int define_calls = 0;
    mutable int postprocess_calls = 0;
    bool warn_on_postprocess = false;
    bool throw_on_postprocess = false;
};

struct ChattyOptions {
    bool verbose = false;
    bool quiet = false;
    int count = 0;
};

/// Declares names that are also global logging options.
class ChattyDefinition : public ArgumentDefinition<ChattyOptions> {
public:
    void define_arguments(args::ArgumentParser& parser,
                          args::ArgumentBinder<ChattyOptions>& binder) const override {
        auto verbose = parser.add_option<bool>("--verbose");
        auto quiet = parser.add_option<bool>("--quiet", "-q");
        auto count = parser.add_option<int>("--count");
        binder.bind(verbose, &ChattyOptions::verbose);
        binder.bind(quiet, &ChattyOptions::quiet);
        binder.bind(count, &ChattyOptions::count);
    }
};

/// Options that count how many instances were ever created.
struct TrackedOptions {
    TrackedOptions() {
        constructed++;
    }

    static inline int constructed = 0;
    int count = 0;
};

class TrackedDefinition : public ArgumentDefinition<TrackedOptions> {
public:
    void define_arguments(args::ArgumentParser& parser,
                          args::ArgumentBinder<TrackedOptions>& binder) const override {
        binder.bind(parser.add_option<int>("--count"), &TrackedOptions::count);
    }
};

ToolInfo count_info() {
    return {"count", "--count=<n> [--label=<s>]", "Count things", std::nullopt};
}

} // namespace

// ============================================================================
// Successful Construction
// ============================================================================

class ToolLifecycleTest : public ::testing::Test {
protected:
    TestContext ctx;
    CountDefinition definition;
};

TEST_F(ToolLifecycleTest, InlineCountBindsOptions) {
    ToolLifecycle<CountOptions> lifecycle(definition, count_info(), {"--count=5"}, ctx.context);

    EXPECT_EQ(lifecycle.options().count, 5);
    EXPECT_EQ(lifecycle.execution_status(), ExecutionStatus::Success);
    EXPECT_FALSE(lifecycle.diagnostics().has_errors());
    EXPECT_EQ(definition.define_calls, 1);
    EXPECT_EQ(definition.postprocess_calls, 1);
}

TEST_F(ToolLifecycleTest, SeparateValueAndShortName) {
    ToolLifecycle<CountOptions> a(definition, count_info(), {"--count", "7"}, ctx.context);
    EXPECT_EQ(a.options().count, 7);

    CountDefinition other;
    ToolLifecycle<CountOptions> b(other, count_info(), {"-c", "-3"}, ctx.context);
    EXPECT_EQ(b.options().count, -3);
}

TEST_F(ToolLifecycleTest, UnsetOptionsKeepDefaults) {
    ToolLifecycle<CountOptions> lifecycle(definition, count_info(), {"--count=1"}, ctx.context);

    EXPECT_EQ(lifecycle.options().label, "");
    EXPECT_FALSE(lifecycle.options().verbose);
}

TEST_F(ToolLifecycleTest, CallbackBindingAndFlag) {
    ToolLifecycle<CountOptions> lifecycle(definition, count_info(),
                                          {"--label", "apples", "--loud", "--count=2"},
                                          ctx.context);

    EXPECT_EQ(lifecycle.options().label, "apples");
    EXPECT_TRUE(lifecycle.options().verbose);
    EXPECT_EQ(lifecycle.options().count, 2);
}

TEST_F(ToolLifecycleTest, CommandNameUsesHostProgram) {
    ctx.context.set_host_program("devkit");
    ToolLifecycle<CountOptions> lifecycle(definition, count_info(), {"--count=1"}, ctx.context);

    EXPECT_EQ(lifecycle.parser().command_name(), "devkit count");
    EXPECT_EQ(lifecycle.parser().usage_line(), "usage: devkit count --count=<n> [--label=<s>]");
}

TEST_F(ToolLifecycleTest, CapturesWorkingDirectory) {
    ctx.file_system.cwd = std::filesystem::path("/tmp/somewhere");
    ToolLifecycle<CountOptions> lifecycle(definition, count_info(), {"--count=1"}, ctx.context);

    EXPECT_EQ(lifecycle.original_working_directory(), std::filesystem::path("/tmp/somewhere"));
}

TEST_F(ToolLifecycleTest, LoggingOptionsAreStrippedBeforeParsing) {
    ToolLifecycle<CountOptions> lifecycle(definition, count_info(),
                                          {"-vv", "--count=4", "--log-filter=args=trace"},
                                          ctx.context);

    EXPECT_EQ(lifecycle.options().count, 4);
    EXPECT_FALSE(lifecycle.diagnostics().has_errors());
}

TEST_F(ToolLifecycleTest, ToolDeclaredLoggingNamesReachTheSchema) {
    ChattyDefinition chatty;
    ToolLifecycle<ChattyOptions> lifecycle(chatty, count_info(),
                                           {"--verbose", "-q", "-vv", "--count=2"}, ctx.context);

    EXPECT_TRUE(lifecycle.options().verbose);
    EXPECT_TRUE(lifecycle.options().quiet);
    EXPECT_EQ(lifecycle.options().count, 2);
    EXPECT_FALSE(lifecycle.diagnostics().has_errors());
}

TEST_F(ToolLifecycleTest, LoggingNamesAreStrippedWhenUndeclared) {
    ToolLifecycle<CountOptions> lifecycle(definition, count_info(),
                                          {"--verbose", "-q", "--count=3"}, ctx.context);

    EXPECT_EQ(lifecycle.options().count, 3);
    EXPECT_FALSE(lifecycle.diagnostics().has_errors());
}

TEST_F(ToolLifecycleTest, WarningsDoNotFailConstruction) {
    definition.warn_on_postprocess = true;
    ToolLifecycle<CountOptions> lifecycle(definition, count_info(), {"--count=1"}, ctx.context);

    EXPECT_EQ(lifecycle.diagnostics().warning_count(), 1u);
    EXPECT_NE(ctx.err_text().find("warning: post-processing saw 1 value(s)"), std::string::npos);
}

// ============================================================================
// Failing Construction
// ============================================================================

TEST_F(ToolLifecycleTest, MissingRequiredCountExitsWithFailure) {
    try {
        ToolLifecycle<CountOptions> lifecycle(definition, count_info(), {}, ctx.context);
        FAIL() << "construction should have exited";
    } catch (const ExitCalled& exit) {
        EXPECT_EQ(exit.code, 1);
    }

    EXPECT_TRUE(ctx.sink.engine().has_errors());
    EXPECT_NE(ctx.err_text().find("error: missing required option --count"), std::string::npos);
    EXPECT_NE(ctx.err_text().find("usage: cltk count"), std::string::npos);
}

TEST_F(ToolLifecycleTest, InvalidCountExitsWithFailure) {
    try {
        ToolLifecycle<CountOptions> lifecycle(definition, count_info(), {"--count=abc"},
                                              ctx.context);
        FAIL() << "construction should have exited";
    } catch (const ExitCalled& exit) {
        EXPECT_EQ(exit.code, 1);
    }

    EXPECT_NE(ctx.err_text().find("invalid value 'abc' (expected an integer) for --count"),
              std::string::npos);
    EXPECT_EQ(definition.postprocess_calls, 0);
}

TEST_F(ToolLifecycleTest, UnknownOptionSuggestsClosestName) {
    EXPECT_THROW(ToolLifecycle<CountOptions>(definition, count_info(), {"--cout=5"}, ctx.context),
                 ExitCalled);

    EXPECT_NE(ctx.err_text().find("error: unknown option --cout"), std::string::npos);
    EXPECT_NE(ctx.err_text().find("did you mean '--count'?"), std::string::npos);
}

TEST_F(ToolLifecycleTest, BindingErrorExitsWithFailure) {
    EXPECT_THROW(ToolLifecycle<CountOptions>(definition, count_info(),
                                             {"--count=1", "--label=forbidden"}, ctx.context),
                 ExitCalled);

    EXPECT_NE(ctx.err_text().find("label 'forbidden' is reserved"), std::string::npos);
}

TEST_F(ToolLifecycleTest, PostprocessErrorExitsWithFailure) {
    definition.throw_on_postprocess = true;
    EXPECT_THROW(ToolLifecycle<CountOptions>(definition, count_info(), {"--count=1"}, ctx.context),
                 ExitCalled);

    EXPECT_NE(ctx.err_text().find("post-processing rejected the arguments"), std::string::npos);
    EXPECT_EQ(ctx.sink.engine().error_count(), 1u);
}

TEST_F(ToolLifecycleTest, MissingWorkingDirectoryExitsBeforeParsing) {
    ctx.file_system.cwd = std::nullopt;
    try {
        ToolLifecycle<CountOptions> lifecycle(definition, count_info(), {"--count=5"},
                                              ctx.context);
        FAIL() << "construction should have exited";
    } catch (const ExitCalled& exit) {
        EXPECT_EQ(exit.code, 1);
    }

    EXPECT_EQ(definition.define_calls, 0);
    EXPECT_EQ(ctx.err_text(), "error: couldn't determine the current working directory\n");
}

TEST_F(ToolLifecycleTest, MissingWorkingDirectoryConstructsNoOptions) {
    TrackedDefinition tracked;
    TrackedOptions::constructed = 0;
    ctx.file_system.cwd = std::nullopt;

    EXPECT_THROW(ToolLifecycle<TrackedOptions>(tracked, count_info(), {"--count=5"}, ctx.context),
                 ExitCalled);
    EXPECT_EQ(TrackedOptions::constructed, 0);

    ctx.file_system.cwd = std::filesystem::path("/work");
    ToolLifecycle<TrackedOptions> lifecycle(tracked, count_info(), {"--count=5"}, ctx.context);
    EXPECT_GT(TrackedOptions::constructed, 0);
    EXPECT_EQ(lifecycle.options().count, 5);
}

// ============================================================================
// Status and Redirection
// ============================================================================

TEST_F(ToolLifecycleTest, MarkFailedIsOneWay) {
    ToolLifecycle<CountOptions> lifecycle(definition, count_info(), {"--count=1"}, ctx.context);

    lifecycle.mark_failed();
    EXPECT_EQ(lifecycle.execution_status(), ExecutionStatus::Failure);
    lifecycle.mark_failed();
    EXPECT_EQ(lifecycle.execution_status(), ExecutionStatus::Failure);
}

TEST_F(ToolLifecycleTest, ExitGoesThroughContextSeam) {
    ToolLifecycle<CountOptions> lifecycle(definition, count_info(), {"--count=1"}, ctx.context);

    try {
        lifecycle.exit(ExecutionStatus::Success);
        FAIL() << "exit should not return";
    } catch (const ExitCalled& exit) {
        EXPECT_EQ(exit.code, 0);
    }
}

TEST_F(ToolLifecycleTest, RedirectMovesOutputAndDiagnosticsToErrorStream) {
    std::ostringstream diagnostics_stream;
    ctx.sink.redirect(diagnostics_stream);

    ToolLifecycle<CountOptions> lifecycle(definition, count_info(), {"--count=1"}, ctx.context);
    lifecycle.out() << "before\n";
    lifecycle.diagnostics().note("first note");
    EXPECT_FALSE(lifecycle.is_redirected());

    lifecycle.redirect_stdout_to_stderr();
    lifecycle.out() << "after\n";
    lifecycle.diagnostics().note("second note");

    EXPECT_TRUE(lifecycle.is_redirected());
    EXPECT_EQ(ctx.out_text(), "before\n");
    EXPECT_EQ(diagnostics_stream.str(), "note: first note\n");
    EXPECT_EQ(ctx.err_text(), "after\nnote: second note\n");
}
