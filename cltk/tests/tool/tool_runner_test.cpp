//! # Tool Runner Tests
//!
//! The driver's status folding: normal return, error diagnostics, thrown
//! errors, and the exit code handed to the exit seam.

#include "tool/tool_runner.hpp"
#include "tool_test_support.hpp"

#include <functional>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

using namespace cltk;
using namespace cltk::tool;
using cltk::testing::ExitCalled;
using cltk::testing::TestContext;

namespace {

struct EmptyOptions {};

class EmptyDefinition : public ArgumentDefinition<EmptyOptions> {
public:
    void define_arguments(args::ArgumentParser& /*parser*/,
                          args::ArgumentBinder<EmptyOptions>& /*binder*/) const override {}
};

/// Runner whose body is supplied by each test.
class ScriptedTool : public ToolRunner<EmptyOptions> {
public:
    ScriptedTool(ToolContext& context, std::function<void(ScriptedTool&)> body)
        : lifecycle_(definition_, {"scripted", "", "Test tool", std::nullopt}, {}, context),
          body_(std::move(body)) {}

    ToolLifecycle<EmptyOptions>& lifecycle() override {
        return lifecycle_;
    }

    void run_impl() override {
        runs++;
        body_(*this);
    }

    using ToolRunner<EmptyOptions>::diagnostics;
    using ToolRunner<EmptyOptions>::out;
    using ToolRunner<EmptyOptions>::redirect_stdout_to_stderr;

    int runs = 0;

private:
    EmptyDefinition definition_;
    ToolLifecycle<EmptyOptions> lifecycle_;
    std::function<void(ScriptedTool&)> body_;
};

} // namespace

class ToolRunnerTest : public ::testing::Test {
protected:
    TestContext ctx;
};

// ============================================================================
// execute()
// ============================================================================

TEST_F(ToolRunnerTest, NormalReturnIsSuccess) {
    ScriptedTool tool(ctx.context, [](ScriptedTool& self) { self.out() << "done\n"; });

    EXPECT_EQ(tool.execute(), ExecutionStatus::Success);
    EXPECT_EQ(tool.runs, 1);
    EXPECT_EQ(ctx.out_text(), "done\n");
    EXPECT_EQ(ctx.err_text(), "");
}

TEST_F(ToolRunnerTest, WarningsAndNotesKeepSuccess) {
    ScriptedTool tool(ctx.context, [](ScriptedTool& self) {
        self.diagnostics().warning("disk nearly full");
        self.diagnostics().note("using cached data");
        self.diagnostics().remark("took 3ms");
    });

    EXPECT_EQ(tool.execute(), ExecutionStatus::Success);
    EXPECT_EQ(ctx.sink.engine().diagnostics().size(), 3u);
}

TEST_F(ToolRunnerTest, OneErrorDiagnosticIsFailure) {
    ScriptedTool tool(ctx.context,
                      [](ScriptedTool& self) { self.diagnostics().error("input is malformed"); });

    EXPECT_EQ(tool.execute(), ExecutionStatus::Failure);
    EXPECT_EQ(ctx.err_text(), "error: input is malformed\n");
}

TEST_F(ToolRunnerTest, ManyErrorDiagnosticsAreOneFailure) {
    ScriptedTool tool(ctx.context, [](ScriptedTool& self) {
        for (int i = 0; i < 5; ++i) {
            self.diagnostics().error("problem " + std::to_string(i));
        }
    });

    EXPECT_EQ(tool.execute(), ExecutionStatus::Failure);
    // No extra record for the escalation itself.
    EXPECT_EQ(ctx.sink.engine().error_count(), 5u);
}

TEST_F(ToolRunnerTest, ThrownErrorIsReportedOnce) {
    ScriptedTool tool(ctx.context,
                      [](ScriptedTool&) { throw Error("could not open 'input.txt'"); });

    EXPECT_EQ(tool.execute(), ExecutionStatus::Failure);
    EXPECT_EQ(ctx.sink.engine().error_count(), 1u);
    EXPECT_EQ(ctx.err_text(), "error: could not open 'input.txt'\n");
}

TEST_F(ToolRunnerTest, ThrownStandardExceptionIsFailure) {
    ScriptedTool tool(ctx.context, [](ScriptedTool&) { throw std::out_of_range("index 9"); });

    EXPECT_EQ(tool.execute(), ExecutionStatus::Failure);
    EXPECT_NE(ctx.err_text().find("error: index 9"), std::string::npos);
}

TEST_F(ToolRunnerTest, ThrownNonExceptionIsUnknownError) {
    ScriptedTool tool(ctx.context, [](ScriptedTool&) { throw 42; });

    EXPECT_EQ(tool.execute(), ExecutionStatus::Failure);
    EXPECT_EQ(ctx.err_text(), "error: unknown error\n");
}

TEST_F(ToolRunnerTest, ThrowAfterWarningIsStillFailure) {
    ScriptedTool tool(ctx.context, [](ScriptedTool& self) {
        self.diagnostics().warning("suspicious input");
        throw Error("giving up");
    });

    EXPECT_EQ(tool.execute(), ExecutionStatus::Failure);
    EXPECT_EQ(tool.lifecycle().execution_status(), ExecutionStatus::Failure);
}

TEST_F(ToolRunnerTest, DiagnosticsAccumulateAcrossRunsWithoutReset) {
    ScriptedTool failing(ctx.context, [](ScriptedTool& self) { self.diagnostics().error("bad"); });
    EXPECT_EQ(failing.execute(), ExecutionStatus::Failure);

    ScriptedTool clean(ctx.context, [](ScriptedTool&) {});
    EXPECT_EQ(clean.execute(), ExecutionStatus::Failure);

    ctx.sink.engine().reset();
    ScriptedTool after_reset(ctx.context, [](ScriptedTool&) {});
    EXPECT_EQ(after_reset.execute(), ExecutionStatus::Success);
}

// ============================================================================
// run()
// ============================================================================

TEST_F(ToolRunnerTest, RunExitsWithZeroOnSuccess) {
    ScriptedTool tool(ctx.context, [](ScriptedTool&) {});

    try {
        tool.run();
        FAIL() << "run should not return";
    } catch (const ExitCalled& exit) {
        EXPECT_EQ(exit.code, 0);
    }
}

TEST_F(ToolRunnerTest, RunExitsWithOneOnErrorDiagnostic) {
    ScriptedTool tool(ctx.context, [](ScriptedTool& self) { self.diagnostics().error("bad"); });

    try {
        tool.run();
        FAIL() << "run should not return";
    } catch (const ExitCalled& exit) {
        EXPECT_EQ(exit.code, 1);
    }
}

TEST_F(ToolRunnerTest, RunExitsWithOneOnThrow) {
    ScriptedTool tool(ctx.context, [](ScriptedTool&) { throw Error("boom"); });

    try {
        tool.run();
        FAIL() << "run should not return";
    } catch (const ExitCalled& exit) {
        EXPECT_EQ(exit.code, 1);
    }
}

TEST_F(ToolRunnerTest, ExitFromRunImplIsNotReportedAsError) {
    ScriptedTool tool(ctx.context,
                      [](ScriptedTool& self) { self.lifecycle().exit(ExecutionStatus::Success); });

    try {
        tool.execute();
        FAIL() << "execute should propagate the exit";
    } catch (const ExitCalled& exit) {
        EXPECT_EQ(exit.code, 0);
    }
    EXPECT_FALSE(ctx.sink.engine().has_errors());
    EXPECT_EQ(tool.lifecycle().execution_status(), ExecutionStatus::Success);
    EXPECT_EQ(ctx.err_text(), "");
}

// ============================================================================
// Redirection During a Run
// ============================================================================

TEST_F(ToolRunnerTest, RedirectInsideRunImplAppliesToLaterOutput) {
    std::ostringstream diagnostics_stream;
    ctx.sink.redirect(diagnostics_stream);

    ScriptedTool tool(ctx.context, [](ScriptedTool& self) {
        self.out() << "data\n";
        self.redirect_stdout_to_stderr();
        self.out() << "info\n";
        self.diagnostics().warning("careful");
    });

    EXPECT_EQ(tool.execute(), ExecutionStatus::Success);
    EXPECT_EQ(ctx.out_text(), "data\n");
    EXPECT_EQ(ctx.err_text(), "info\nwarning: careful\n");
    EXPECT_EQ(diagnostics_stream.str(), "");
}
