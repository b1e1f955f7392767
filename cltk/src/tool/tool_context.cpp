#include "tool/tool_context.hpp"

namespace cltk::tool {

ToolContext::ToolContext(diag::DiagnosticsSink& diagnostics, const fs::FileSystem& file_system,
                         ProcessExit exit, std::ostream& out, std::ostream& err)
    : diagnostics_(&diagnostics), file_system_(&file_system), exit_(std::move(exit)), out_(&out),
      err_(&err) {}

ToolContext& ToolContext::process() {
    static ToolContext context(diag::DiagnosticsSink::process(), fs::local_file_system());
    return context;
}

} // namespace cltk::tool
