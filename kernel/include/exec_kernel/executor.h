#pragma once

#include <optional>
#include <string>
#include "config.h"
#include "result.h"

namespace exec_kernel {

struct ExecutionRequest {
    std::string code;
    double timeout_seconds = 20;   // always within (0, max_timeout_seconds]
    bool capture_plots = true;

    /// Build a request from tool input fields: code is whitespace-trimmed,
    /// a missing timeout takes the configured default, and the result is clamped.
    static ExecutionRequest from_fields(
        const std::string& code,
        std::optional<double> timeout_seconds = std::nullopt,
        std::optional<bool> save_plots = std::nullopt,
        const ExecutorConfig& config = {}
    );
};

/// min(requested, max); non-positive or non-finite values fall back to the default.
double clamp_timeout(double requested, const ExecutorConfig& config = {});

struct ToolMetadata {
    std::string name;
    std::string description;
    std::string input_schema;      // JSON Schema text
};

/// Runs caller-supplied Python under the import policy in a child process.
/// Holds no per-request state; one instance may serve concurrent callers.
class CodeExecutor {
public:
    CodeExecutor();
    explicit CodeExecutor(ExecutorConfig config);

    /// Synthesize, run and assemble. Never throws: harness failures come back
    /// as ExecutionResult::error with empty content.
    ExecutionResult execute(const ExecutionRequest& request) const;

    ExecutionResult execute_code(
        const std::string& code,
        std::optional<double> timeout_seconds = std::nullopt,
        std::optional<bool> save_plots = std::nullopt
    ) const;

    const ExecutorConfig& config() const noexcept { return config_; }

    static ToolMetadata tool_metadata();

private:
    ExecutionResult run(const ExecutionRequest& request) const;

    ExecutorConfig config_;
};

} // namespace exec_kernel
