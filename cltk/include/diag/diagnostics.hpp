//! # Diagnostics
//!
//! User-facing diagnostics for tools built on cltk.
//!
//! ## Components
//!
//! | Type                 | Role                                               |
//! |----------------------|----------------------------------------------------|
//! | `Diagnostic`         | One record: severity, message, notes               |
//! | `DiagnosticsEngine`  | Accumulates records and fans them out to handlers  |
//! | `DiagnosticsPrinter` | Handler that renders records to an output stream   |
//! | `DiagnosticsSink`    | An engine wired to exactly one printer             |
//!
//! ## Output Format
//!
//! ```text
//! error: couldn't determine the current working directory
//! warning: --separator is ignored when only one word is given
//!   = note: usage: cltk repeat --count=<n> <words...>
//! ```
//!
//! A sink is an explicit context object. Real binaries use the lazily
//! created `DiagnosticsSink::process()`; tests construct their own.

#ifndef CLTK_DIAG_DIAGNOSTICS_HPP
#define CLTK_DIAG_DIAGNOSTICS_HPP

#include <cstddef>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

namespace cltk::diag {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightCyan = "\033[96m";
};

// ============================================================================
// Diagnostic Record
// ============================================================================

enum class DiagnosticSeverity {
    Error,
    Warning,
    Note,
    Remark,
};

/// Lower-case severity name as printed ("error", "warning", ...).
const char* severity_name(DiagnosticSeverity severity);

struct Diagnostic {
    DiagnosticSeverity severity;
    std::string message;
    std::vector<std::string> notes; // Rendered as "  = note: ..." lines
};

// ============================================================================
// Diagnostics Engine
// ============================================================================

/// Accumulates diagnostics for a run and forwards each one to every handler.
///
/// Records are kept until `reset()`. Nothing resets them implicitly, so a
/// host that runs several tools against one engine sees the union of their
/// diagnostics.
class DiagnosticsEngine {
public:
    using Handler = std::function<void(const Diagnostic&)>;

    DiagnosticsEngine() = default;
    explicit DiagnosticsEngine(std::vector<Handler> handlers);

    DiagnosticsEngine(const DiagnosticsEngine&) = delete;
    DiagnosticsEngine& operator=(const DiagnosticsEngine&) = delete;

    void add_handler(Handler handler);

    void emit(Diagnostic diag);
    void emit(DiagnosticSeverity severity, std::string message);

    void error(std::string message, std::vector<std::string> notes = {});
    void warning(std::string message, std::vector<std::string> notes = {});
    void note(std::string message);
    void remark(std::string message);

    /// True iff any emitted record has error severity.
    bool has_errors() const {
        return error_count_ > 0;
    }

    size_t error_count() const {
        return error_count_;
    }
    size_t warning_count() const {
        return warning_count_;
    }

    const std::vector<Diagnostic>& diagnostics() const {
        return diagnostics_;
    }

    /// Forget every accumulated record and reset the counts.
    void reset();

private:
    std::vector<Handler> handlers_;
    std::vector<Diagnostic> diagnostics_;
    size_t error_count_ = 0;
    size_t warning_count_ = 0;
};

// ============================================================================
// Diagnostics Printer
// ============================================================================

/// Renders diagnostics as text onto a replaceable output stream.
class DiagnosticsPrinter {
public:
    explicit DiagnosticsPrinter(std::ostream& out = std::cerr);
    DiagnosticsPrinter(std::ostream& out, bool use_colors);

    void print(const Diagnostic& diag);

    void set_stream(std::ostream& out) {
        out_ = &out;
    }
    std::ostream& stream() const {
        return *out_;
    }

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }
    bool color_enabled() const {
        return use_colors_;
    }

private:
    std::ostream* out_;
    bool use_colors_;

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }
    const char* severity_color(DiagnosticSeverity sev) const;
};

// ============================================================================
// Diagnostics Sink
// ============================================================================

/// A diagnostics engine with exactly one registered printer.
///
/// The printer's stream is the sink's output handle. `redirect()` swaps it,
/// which is how a tool moves its diagnostics off standard output.
class DiagnosticsSink {
public:
    explicit DiagnosticsSink(std::ostream& out = std::cerr);
    DiagnosticsSink(std::ostream& out, bool use_colors);

    DiagnosticsSink(const DiagnosticsSink&) = delete;
    DiagnosticsSink& operator=(const DiagnosticsSink&) = delete;

    /// The process-wide sink, created on first use and printing to stderr.
    static DiagnosticsSink& process();

    DiagnosticsEngine& engine() {
        return engine_;
    }
    const DiagnosticsEngine& engine() const {
        return engine_;
    }

    DiagnosticsPrinter& printer() {
        return printer_;
    }

    void redirect(std::ostream& out) {
        printer_.set_stream(out);
    }
    std::ostream& stream() const {
        return printer_.stream();
    }

private:
    DiagnosticsPrinter printer_;
    DiagnosticsEngine engine_;
};

// ============================================================================
// Helpers
// ============================================================================

/// True when stderr is a terminal that understands ANSI colors.
bool terminal_supports_colors();

/// Levenshtein (edit) distance between two strings.
size_t levenshtein_distance(const std::string& s1, const std::string& s2);

/// Closest candidate within `max_distance` edits, or an empty string.
std::string find_similar(const std::string& input, const std::vector<std::string>& candidates,
                         size_t max_distance = 3);

} // namespace cltk::diag

#endif // CLTK_DIAG_DIAGNOSTICS_HPP
