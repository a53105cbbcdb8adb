#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include "exec_kernel/config.h"
#include "exec_kernel/executor.h"
#include "exec_kernel/policy.h"
#include "exec_kernel/process.h"
#include "exec_kernel/result.h"
#include "exec_kernel/sandbox.h"

namespace py = pybind11;
using namespace exec_kernel;

namespace {

template <typename T>
std::optional<T> optional_item(const py::dict& input, const char* key) {
    if (!input.contains(key) || input[key].is_none()) return std::nullopt;
    return input[key].cast<T>();
}

// Tool-dispatch entry: (content, Exception | None)
py::tuple execute_code(const CodeExecutor& executor, const py::dict& input) {
    std::string code = input.contains("code") ? input["code"].cast<std::string>() : std::string();
    auto timeout = optional_item<double>(input, "timeout");
    auto save_plots = optional_item<bool>(input, "save_plots");

    ExecutionResult result;
    {
        py::gil_scoped_release release;
        result = executor.execute_code(code, timeout, save_plots);
    }

    py::object error = py::none();
    if (result.error) {
        error = py::module_::import("builtins").attr("Exception")(result.error->message);
    }
    return py::make_tuple(result.content, error);
}

} // anonymous namespace

PYBIND11_MODULE(exec_kernel, m) {
    m.doc() = "Policy-gated Python code execution: allow-listed imports, write guard, "
              "plot capture and bounded output, each run in its own child process";

    configure_logging();

    // ── Policy ──────────────────────────────────────────────────────────

    py::class_<PolicyTable>(m, "PolicyTable")
        .def_static("is_allowed", &PolicyTable::is_allowed, py::arg("top_level"))
        .def_static("resolve_install_name", &PolicyTable::resolve_install_name, py::arg("top_level"))
        .def_static("is_install_exempt", &PolicyTable::is_install_exempt, py::arg("top_level"))
        .def_static("top_level_package", &PolicyTable::top_level_package, py::arg("module_name"))
        .def_static("allowed_modules", &PolicyTable::allowed_modules)
        .def_static("name_overrides", &PolicyTable::name_overrides)
        .def_static("install_exceptions", &PolicyTable::install_exceptions);

    // ── Configuration ───────────────────────────────────────────────────

    py::class_<ResourceLimits>(m, "ResourceLimits")
        .def(py::init<>())
        .def_readwrite("max_cpu_seconds", &ResourceLimits::max_cpu_seconds)
        .def_readwrite("max_memory_bytes", &ResourceLimits::max_memory_bytes)
        .def_readwrite("max_file_size", &ResourceLimits::max_file_size)
        .def_readwrite("max_open_files", &ResourceLimits::max_open_files)
        .def_readwrite("max_processes", &ResourceLimits::max_processes);

    py::class_<ExecutorConfig>(m, "ExecutorConfig")
        .def(py::init<>())
        .def_static("from_env", &ExecutorConfig::from_env)
        .def_readwrite("interpreter", &ExecutorConfig::interpreter)
        .def_readwrite("default_timeout_seconds", &ExecutorConfig::default_timeout_seconds)
        .def_readwrite("max_timeout_seconds", &ExecutorConfig::max_timeout_seconds)
        .def_readwrite("max_output_chars", &ExecutorConfig::max_output_chars)
        .def_readwrite("enable_write_guard", &ExecutorConfig::enable_write_guard)
        .def_readwrite("plot_output_dir", &ExecutorConfig::plot_output_dir)
        .def_readwrite("working_dir", &ExecutorConfig::working_dir)
        .def_readwrite("limits", &ExecutorConfig::limits);

    // ── Execution ───────────────────────────────────────────────────────

    py::class_<ExecutionRequest>(m, "ExecutionRequest")
        .def(py::init(&ExecutionRequest::from_fields),
             py::arg("code"), py::arg("timeout") = py::none(), py::arg("save_plots") = py::none(),
             py::arg("config") = ExecutorConfig{})
        .def_readonly("code", &ExecutionRequest::code)
        .def_readonly("timeout_seconds", &ExecutionRequest::timeout_seconds)
        .def_readonly("capture_plots", &ExecutionRequest::capture_plots);

    py::class_<ExecutionResult>(m, "ExecutionResult")
        .def_readonly("content", &ExecutionResult::content)
        .def_property_readonly("error", [](const ExecutionResult& r) -> std::optional<std::string> {
            if (!r.error) return std::nullopt;
            return r.error->message;
        });

    py::class_<ToolMetadata>(m, "ToolMetadata")
        .def_readonly("name", &ToolMetadata::name)
        .def_readonly("description", &ToolMetadata::description)
        .def_readonly("input_schema", &ToolMetadata::input_schema);

    py::class_<CodeExecutor>(m, "CodeExecutor")
        .def(py::init<>())
        .def(py::init<ExecutorConfig>(), py::arg("config"))
        .def("execute", &CodeExecutor::execute, py::arg("request"),
             py::call_guard<py::gil_scoped_release>())
        .def("execute_code", &execute_code, py::arg("input"))
        .def_property_readonly("config", &CodeExecutor::config)
        .def_static("tool_metadata", &CodeExecutor::tool_metadata);

    m.def("execute_code", [](const py::dict& input) {
        static const CodeExecutor executor;
        return execute_code(executor, input);
    }, py::arg("input"));
}
