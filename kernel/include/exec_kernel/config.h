#pragma once

#include <cstddef>
#include <string>
#include "process.h"

namespace exec_kernel {

/// No run may be granted more wall-clock time than this.
constexpr double kTimeoutCeiling = 40;

struct ExecutorConfig {
    std::string interpreter;                 // empty = find_interpreter()
    double default_timeout_seconds = 20;
    double max_timeout_seconds = 40;         // capped at kTimeoutCeiling wherever it is used
    size_t max_output_chars = 10000;
    bool enable_write_guard = true;
    std::string plot_output_dir = ".";
    std::string working_dir;                 // child cwd; empty = inherit
    ResourceLimits limits;
    size_t max_capture_bytes = 4 << 20;

    /// Defaults overridden by EXEC_KERNEL_* environment variables.
    /// Malformed values are logged and ignored.
    static ExecutorConfig from_env();
};

/// Locate a Python interpreter: $EXEC_KERNEL_PYTHON, /usr/bin/python3,
/// /usr/local/bin/python3, then $PATH. Throws std::runtime_error if none.
std::string find_interpreter();

/// Apply EXEC_KERNEL_LOG_LEVEL to the default spdlog logger.
void configure_logging();

} // namespace exec_kernel
