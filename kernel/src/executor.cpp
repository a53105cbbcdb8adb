#include "exec_kernel/executor.h"

#include "exec_kernel/sandbox.h"
#include "exec_kernel/script.h"

#include <unistd.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>
#include <stdexcept>
#include <utility>

namespace exec_kernel {

namespace {

std::string resolve_interpreter(const ExecutorConfig& config) {
    if (config.interpreter.empty()) return find_interpreter();
    if (access(config.interpreter.c_str(), X_OK) != 0) {
        throw std::runtime_error("interpreter is not executable: " + config.interpreter);
    }
    return config.interpreter;
}

} // anonymous namespace

double clamp_timeout(double requested, const ExecutorConfig& config) {
    if (!std::isfinite(requested) || requested <= 0) {
        requested = config.default_timeout_seconds;
    }
    return std::min({requested, config.max_timeout_seconds, kTimeoutCeiling});
}

ExecutionRequest ExecutionRequest::from_fields(
    const std::string& code,
    std::optional<double> timeout_seconds,
    std::optional<bool> save_plots,
    const ExecutorConfig& config
) {
    ExecutionRequest request;
    request.code = ResultAssembler::trim(code);
    request.timeout_seconds = clamp_timeout(
        timeout_seconds.value_or(config.default_timeout_seconds), config);
    request.capture_plots = save_plots.value_or(true);
    return request;
}

CodeExecutor::CodeExecutor() : CodeExecutor(ExecutorConfig::from_env()) {}

CodeExecutor::CodeExecutor(ExecutorConfig config) : config_(std::move(config)) {
    if (!(config_.max_timeout_seconds <= kTimeoutCeiling)) {
        spdlog::warn("Max timeout {}s exceeds the {}s ceiling, clamping",
                     config_.max_timeout_seconds, kTimeoutCeiling);
        config_.max_timeout_seconds = kTimeoutCeiling;
    }
}

ExecutionResult CodeExecutor::execute_code(
    const std::string& code,
    std::optional<double> timeout_seconds,
    std::optional<bool> save_plots
) const {
    return execute(ExecutionRequest::from_fields(code, timeout_seconds, save_plots, config_));
}

ExecutionResult CodeExecutor::execute(const ExecutionRequest& request) const {
    if (ResultAssembler::trim(request.code).empty()) {
        return ResultAssembler::no_code();
    }

    try {
        return run(request);
    } catch (const std::exception& e) {
        spdlog::error("Code execution failed: {}", e.what());
        return ResultAssembler::failure(e.what());
    }
}

ExecutionResult CodeExecutor::run(const ExecutionRequest& request) const {
    const double timeout = clamp_timeout(request.timeout_seconds, config_);

    RunnerOptions options;
    options.interpreter = resolve_interpreter(config_);
    options.working_dir = config_.working_dir;
    options.limits = config_.limits;
    options.max_capture_bytes = config_.max_capture_bytes;
    if (request.capture_plots) {
        options.plot_output_dir = config_.plot_output_dir;
    }

    spdlog::info("Executing {} bytes of code (timeout {:.1f}s, plots {})",
                 request.code.size(), timeout, request.capture_plots ? "on" : "off");
    spdlog::debug("Code:\n{}", request.code);

    ScriptOptions script;
    script.write_guard = config_.enable_write_guard;
    script.capture_plots = request.capture_plots;
    script.install_timeout_seconds = timeout;

    ExecutionOutcome outcome = Sandbox::run_program(
        [&](const std::string& scratch_dir) {
            ScriptOptions scoped = script;
            scoped.plot_dir = scratch_dir;
            return ScriptSynthesizer::synthesize(request.code, scoped);
        },
        timeout, options);

    if (outcome.timed_out) {
        spdlog::warn("Code execution timed out after {:.1f}s", timeout);
    } else {
        spdlog::info("Code execution finished in {:.2f}s (exit {})",
                     outcome.elapsed_seconds, outcome.exit_code);
    }

    return ResultAssembler::assemble(outcome, request.capture_plots, config_.max_output_chars);
}

ToolMetadata CodeExecutor::tool_metadata() {
    return {
        "execute_code",
        "Execute Python code in a sandboxed child process and return its output. "
        "Imports are restricted to an allow-list of common libraries (missing ones are "
        "installed on demand), file writes are refused, and matplotlib figures are saved "
        "as plot_<n>.png.",
        R"({"type":"object","properties":{)"
        R"("code":{"type":"string","description":"Python code to execute."},)"
        R"("timeout":{"type":"number","description":"Maximum execution time in seconds (default 20, max 40)."},)"
        R"("save_plots":{"type":"boolean","description":"Save matplotlib figures to files (default true)."})"
        R"(},"required":["code"]})"
    };
}

} // namespace exec_kernel
