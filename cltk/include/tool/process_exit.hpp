//! # Process Exit
//!
//! The single way a cltk tool ends the process. The terminating call is an
//! injectable handler; tests install one that throws instead of exiting.

#ifndef CLTK_TOOL_PROCESS_EXIT_HPP
#define CLTK_TOOL_PROCESS_EXIT_HPP

#include "tool/execution_status.hpp"

#include <functional>

namespace cltk::tool {

/// Thrown by an exit handler that unwinds instead of ending the process.
/// Lifecycle construction and the runner's driver let it pass unreported.
struct ExitInterrupted {
    int code;
};

class ProcessExit {
public:
    using Handler = std::function<void(int code)>;

    /// Exits through std::exit.
    ProcessExit();
    explicit ProcessExit(Handler handler);

    /// Flush logs and standard streams, then hand the exit code to the
    /// handler. If the handler returns, std::exit is called with the same code.
    [[noreturn]] void operator()(ExecutionStatus status) const;

private:
    Handler handler_;
};

} // namespace cltk::tool

#endif // CLTK_TOOL_PROCESS_EXIT_HPP
