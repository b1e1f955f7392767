//! # Tool Context
//!
//! Process-level collaborators handed to every tool lifecycle: the
//! diagnostics sink, the file system, the standard streams, the host program
//! name and the exit seam.
//!
//! Binaries use `ToolContext::process()`. Tests build a context over their
//! own sink, streams and exit handler.

#ifndef CLTK_TOOL_TOOL_CONTEXT_HPP
#define CLTK_TOOL_TOOL_CONTEXT_HPP

#include "diag/diagnostics.hpp"
#include "fs/file_system.hpp"
#include "tool/process_exit.hpp"

#include <iostream>
#include <string>

namespace cltk::tool {

class ToolContext {
public:
    ToolContext(diag::DiagnosticsSink& diagnostics, const fs::FileSystem& file_system,
                ProcessExit exit = ProcessExit(), std::ostream& out = std::cout,
                std::ostream& err = std::cerr);

    ToolContext(const ToolContext&) = delete;
    ToolContext& operator=(const ToolContext&) = delete;

    /// Context over the process-wide diagnostics sink, the local file system,
    /// std::cout/std::cerr and std::exit. Created on first use.
    static ToolContext& process();

    diag::DiagnosticsSink& diagnostics() const {
        return *diagnostics_;
    }
    const fs::FileSystem& file_system() const {
        return *file_system_;
    }
    std::ostream& out() const {
        return *out_;
    }
    std::ostream& err() const {
        return *err_;
    }

    /// Prefix of every synthesized command name ("<host> <tool>").
    const std::string& host_program() const {
        return host_program_;
    }
    void set_host_program(std::string name) {
        host_program_ = std::move(name);
    }

    /// Whether lifecycle construction reinitializes the global logger from
    /// the logging options it strips.
    bool configures_logging() const {
        return configure_logging_;
    }
    void set_configure_logging(bool enabled) {
        configure_logging_ = enabled;
    }

    [[noreturn]] void exit_with(ExecutionStatus status) const {
        exit_(status);
    }

private:
    diag::DiagnosticsSink* diagnostics_;
    const fs::FileSystem* file_system_;
    ProcessExit exit_;
    std::ostream* out_;
    std::ostream* err_;
    std::string host_program_ = "cltk";
    bool configure_logging_ = true;
};

} // namespace cltk::tool

#endif // CLTK_TOOL_TOOL_CONTEXT_HPP
