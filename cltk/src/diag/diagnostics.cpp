#include "diag/diagnostics.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <io.h>
#include <windows.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace cltk::diag {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
#ifdef _WIN32
    HANDLE hOut = GetStdHandle(STD_ERROR_HANDLE);
    if (hOut == INVALID_HANDLE_VALUE)
        return false;

    DWORD dwMode = 0;
    if (!GetConsoleMode(hOut, &dwMode))
        return false;

    dwMode |= ENABLE_VIRTUAL_TERMINAL_PROCESSING;
    if (SetConsoleMode(hOut, dwMode))
        return true;

    return isatty(fileno(stderr)) != 0;
#else
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
#endif
}

const char* severity_name(DiagnosticSeverity severity) {
    switch (severity) {
    case DiagnosticSeverity::Error:
        return "error";
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Note:
        return "note";
    case DiagnosticSeverity::Remark:
        return "remark";
    }
    return "unknown";
}

// ============================================================================
// DiagnosticsEngine
// ============================================================================

DiagnosticsEngine::DiagnosticsEngine(std::vector<Handler> handlers)
    : handlers_(std::move(handlers)) {}

void DiagnosticsEngine::add_handler(Handler handler) {
    handlers_.push_back(std::move(handler));
}

void DiagnosticsEngine::emit(Diagnostic diag) {
    if (diag.severity == DiagnosticSeverity::Error) {
        error_count_++;
    } else if (diag.severity == DiagnosticSeverity::Warning) {
        warning_count_++;
    }

    CLTK_LOG_DEBUG("diag", "emit " << severity_name(diag.severity) << ": " << diag.message);

    diagnostics_.push_back(std::move(diag));
    const Diagnostic& stored = diagnostics_.back();
    for (const auto& handler : handlers_) {
        handler(stored);
    }
}

void DiagnosticsEngine::emit(DiagnosticSeverity severity, std::string message) {
    emit(Diagnostic{severity, std::move(message), {}});
}

void DiagnosticsEngine::error(std::string message, std::vector<std::string> notes) {
    emit(Diagnostic{DiagnosticSeverity::Error, std::move(message), std::move(notes)});
}

void DiagnosticsEngine::warning(std::string message, std::vector<std::string> notes) {
    emit(Diagnostic{DiagnosticSeverity::Warning, std::move(message), std::move(notes)});
}

void DiagnosticsEngine::note(std::string message) {
    emit(DiagnosticSeverity::Note, std::move(message));
}

void DiagnosticsEngine::remark(std::string message) {
    emit(DiagnosticSeverity::Remark, std::move(message));
}

void DiagnosticsEngine::reset() {
    diagnostics_.clear();
    error_count_ = 0;
    warning_count_ = 0;
}

// ============================================================================
// DiagnosticsPrinter
// ============================================================================

DiagnosticsPrinter::DiagnosticsPrinter(std::ostream& out)
    : out_(&out), use_colors_(&out == &std::cerr && terminal_supports_colors()) {}

DiagnosticsPrinter::DiagnosticsPrinter(std::ostream& out, bool use_colors)
    : out_(&out), use_colors_(use_colors) {}

const char* DiagnosticsPrinter::severity_color(DiagnosticSeverity sev) const {
    switch (sev) {
    case DiagnosticSeverity::Error:
        return Colors::BrightRed;
    case DiagnosticSeverity::Warning:
        return Colors::BrightYellow;
    case DiagnosticSeverity::Note:
        return Colors::BrightCyan;
    case DiagnosticSeverity::Remark:
        return Colors::BrightGreen;
    }
    return Colors::Reset;
}

void DiagnosticsPrinter::print(const Diagnostic& diag) {
    // Format: error: message
    *out_ << color(Colors::Bold) << color(severity_color(diag.severity))
          << severity_name(diag.severity) << color(Colors::Reset) << color(Colors::Bold) << ": "
          << diag.message << color(Colors::Reset) << "\n";

    for (const auto& note : diag.notes) {
        *out_ << color(Colors::BrightCyan) << "  = note" << color(Colors::Reset) << ": " << note
              << "\n";
    }
    out_->flush();
}

// ============================================================================
// DiagnosticsSink
// ============================================================================

DiagnosticsSink::DiagnosticsSink(std::ostream& out) : printer_(out) {
    engine_.add_handler([this](const Diagnostic& diag) { printer_.print(diag); });
}

DiagnosticsSink::DiagnosticsSink(std::ostream& out, bool use_colors) : printer_(out, use_colors) {
    engine_.add_handler([this](const Diagnostic& diag) { printer_.print(diag); });
}

DiagnosticsSink& DiagnosticsSink::process() {
    static DiagnosticsSink sink(std::cerr);
    return sink;
}

// ============================================================================
// "Did You Mean?" Suggestions
// ============================================================================

size_t levenshtein_distance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);

    for (size_t j = 0; j <= n; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr_row[0] = i;

        for (size_t j = 1; j <= n; ++j) {
            // Case-insensitive comparison
            char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(s1[i - 1])));
            char c2 = static_cast<char>(std::tolower(static_cast<unsigned char>(s2[j - 1])));

            size_t cost = (c1 == c2) ? 0 : 1;

            curr_row[j] = std::min({prev_row[j] + 1,          // deletion
                                    curr_row[j - 1] + 1,      // insertion
                                    prev_row[j - 1] + cost}); // substitution
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

std::string find_similar(const std::string& input, const std::vector<std::string>& candidates,
                         size_t max_distance) {
    if (input.empty() || candidates.empty()) {
        return "";
    }

    std::string best_match;
    size_t best_distance = max_distance + 1;

    for (const auto& candidate : candidates) {
        size_t len_diff = input.length() > candidate.length() ? input.length() - candidate.length()
                                                              : candidate.length() - input.length();
        if (len_diff > max_distance) {
            continue;
        }

        size_t dist = levenshtein_distance(input, candidate);
        if (dist < best_distance) {
            best_distance = dist;
            best_match = candidate;
        }
    }

    return best_match;
}

} // namespace cltk::diag
