#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include "sandbox.h"

namespace exec_kernel {

/// Failure in the harness itself, as opposed to a fault in the caller's code.
struct ExecutionError {
    std::string message;
};

struct ExecutionResult {
    std::string content;
    std::optional<ExecutionError> error;
};

/// Turns a finished run into the single displayable result.
class ResultAssembler {
public:
    static constexpr size_t kDefaultMaxChars = 10000;
    static constexpr const char* kNoOutput = "(No output)";
    static constexpr const char* kErrorsSeparator = "\n\nErrors:\n";
    static constexpr const char* kTimedOut = "Error: Code execution timed out.";
    static constexpr const char* kNoCode = "Error: No code provided to execute.";
    static constexpr const char* kFailurePrefix = "Error executing code: ";

    static ExecutionResult assemble(
        const ExecutionOutcome& outcome,
        bool capture_plots,
        size_t max_chars = kDefaultMaxChars
    );

    static ExecutionResult timed_out();
    static ExecutionResult no_code();
    static ExecutionResult failure(const std::string& what);

    /// Keep the first max_chars code points and append the truncation notice.
    static std::string truncate(const std::string& text, size_t max_chars = kDefaultMaxChars);

    static std::string trim(const std::string& text);
};

} // namespace exec_kernel
