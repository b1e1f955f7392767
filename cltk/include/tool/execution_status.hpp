//! # Execution Status
//!
//! The binary outcome of one tool invocation and its exit-code mapping.

#ifndef CLTK_TOOL_EXECUTION_STATUS_HPP
#define CLTK_TOOL_EXECUTION_STATUS_HPP

namespace cltk::tool {

enum class ExecutionStatus {
    Success,
    Failure,
};

/// Success -> 0, Failure -> 1.
constexpr int to_exit_code(ExecutionStatus status) {
    return status == ExecutionStatus::Success ? 0 : 1;
}

inline const char* status_name(ExecutionStatus status) {
    return status == ExecutionStatus::Success ? "success" : "failure";
}

} // namespace cltk::tool

#endif // CLTK_TOOL_EXECUTION_STATUS_HPP
