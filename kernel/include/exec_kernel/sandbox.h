#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>
#include "process.h"

namespace exec_kernel {

struct SandboxPolicy {
    ResourceLimits limits;
    std::string working_dir;               // empty = inherit
    std::vector<std::string> env;          // KEY=VALUE pairs, the child's entire environment
    size_t max_capture_bytes = 4 << 20;    // per stream; excess is read and dropped
};

struct ExecutionOutcome {
    int exit_code = -1;
    int term_signal = 0;
    std::string stdout_output;
    std::string stderr_output;
    double elapsed_seconds = 0.0;
    bool timed_out = false;
    bool crashed = false;                  // terminated by a signal we did not send
    std::vector<std::string> plot_files;   // published artifact paths, in order
};

struct RunnerOptions {
    std::string interpreter;               // absolute path of the Python interpreter
    std::string working_dir;
    std::string plot_output_dir;           // empty = do not publish figures
    ResourceLimits limits;
    size_t max_capture_bytes = 4 << 20;
};

/// Produces the program text given the private scratch directory it will run from.
using ProgramBuilder = std::function<std::string(const std::string& scratch_dir)>;

/// Isolated child execution with a wall-clock deadline.
class Sandbox {
public:
    static constexpr const char* kModuleName = "sandbox_script";

    /// Run argv (argv[0] must be a path) with no deadline.
    static ExecutionOutcome run(const std::vector<std::string>& argv, const SandboxPolicy& policy = {});

    /// Run argv; on expiry the whole process group is killed and timed_out is set.
    static ExecutionOutcome run_with_timeout(
        const std::vector<std::string>& argv,
        double timeout_seconds,
        const SandboxPolicy& policy = {}
    );

    /// Write the built program and a package marker into a fresh temporary
    /// directory, run it as a module with a minimal environment, publish any
    /// figures it saved, and remove the directory whatever happens.
    static ExecutionOutcome run_program(
        const ProgramBuilder& build,
        double timeout_seconds,
        const RunnerOptions& options
    );

    /// Copy plot_<n>.png files from scratch_dir to output_dir in numeric order.
    /// Returns the published paths; copy failures are logged and skipped.
    static std::vector<std::string> publish_plots(
        const std::string& scratch_dir,
        const std::string& output_dir
    );
};

} // namespace exec_kernel
