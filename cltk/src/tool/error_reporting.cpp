#include "tool/error_reporting.hpp"

#include "args/argument_parser.hpp"
#include "error.hpp"
#include "log/log.hpp"

#include <vector>

namespace cltk::tool {

void report_error(std::exception_ptr error, diag::DiagnosticsEngine& diagnostics,
                  const std::string& usage_line) {
    if (!error)
        return;

    try {
        std::rethrow_exception(error);
    } catch (const DiagnosticsReportedError&) {
        CLTK_LOG_DEBUG("lifecycle", diagnostics.error_count() << " error diagnostic(s) reported");
    } catch (const args::ArgumentParserError& e) {
        std::vector<std::string> notes;
        if (!e.suggestion().empty()) {
            notes.push_back("did you mean '" + e.suggestion() + "'?");
        }
        if (!usage_line.empty()) {
            notes.push_back(usage_line);
        }
        diagnostics.error(e.what(), std::move(notes));
    } catch (const std::exception& e) {
        std::string message = e.what();
        diagnostics.error(message.empty() ? "unknown error" : message);
    } catch (...) {
        diagnostics.error("unknown error");
    }
}

} // namespace cltk::tool
