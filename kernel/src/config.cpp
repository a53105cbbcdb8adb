#include "exec_kernel/config.h"

#include <sys/stat.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace exec_kernel {

namespace {

const char* env_value(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

bool parse_seconds(const char* name, double& out) {
    const char* value = env_value(name);
    if (!value) return false;
    char* end = nullptr;
    double parsed = std::strtod(value, &end);
    if (end == value || *end != '\0' || !std::isfinite(parsed) || parsed <= 0) {
        spdlog::warn("Ignoring {}={}: expected a positive number of seconds", name, value);
        return false;
    }
    out = parsed;
    return true;
}

bool parse_flag(const char* name, bool& out) {
    const char* value = env_value(name);
    if (!value) return false;
    std::string v(value);
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "1" || v == "true" || v == "on" || v == "yes") { out = true; return true; }
    if (v == "0" || v == "false" || v == "off" || v == "no") { out = false; return true; }
    spdlog::warn("Ignoring {}={}: expected a boolean", name, value);
    return false;
}

bool is_executable(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(path.c_str(), X_OK) == 0;
}

} // anonymous namespace

ExecutorConfig ExecutorConfig::from_env() {
    ExecutorConfig config;

    if (const char* python = env_value("EXEC_KERNEL_PYTHON")) config.interpreter = python;
    if (const char* dir = env_value("EXEC_KERNEL_PLOT_DIR")) config.plot_output_dir = dir;
    if (const char* dir = env_value("EXEC_KERNEL_WORKDIR")) config.working_dir = dir;

    parse_seconds("EXEC_KERNEL_MAX_TIMEOUT", config.max_timeout_seconds);
    parse_seconds("EXEC_KERNEL_DEFAULT_TIMEOUT", config.default_timeout_seconds);
    parse_flag("EXEC_KERNEL_WRITE_GUARD", config.enable_write_guard);

    if (config.max_timeout_seconds > kTimeoutCeiling) {
        spdlog::warn("Max timeout {}s exceeds the {}s ceiling, clamping",
                     config.max_timeout_seconds, kTimeoutCeiling);
        config.max_timeout_seconds = kTimeoutCeiling;
    }
    config.default_timeout_seconds = std::min(config.default_timeout_seconds, config.max_timeout_seconds);

    return config;
}

std::string find_interpreter() {
    if (const char* python = env_value("EXEC_KERNEL_PYTHON")) {
        if (is_executable(python)) return python;
        throw std::runtime_error(std::string("EXEC_KERNEL_PYTHON is not executable: ") + python);
    }

    for (const char* candidate : {"/usr/bin/python3", "/usr/local/bin/python3"}) {
        if (is_executable(candidate)) return candidate;
    }

    if (const char* path = env_value("PATH")) {
        std::istringstream dirs(path);
        std::string dir;
        while (std::getline(dirs, dir, ':')) {
            if (dir.empty()) continue;
            std::string candidate = dir + "/python3";
            if (is_executable(candidate)) return candidate;
        }
    }

    throw std::runtime_error("no Python interpreter found (set EXEC_KERNEL_PYTHON)");
}

void configure_logging() {
    const char* level = env_value("EXEC_KERNEL_LOG_LEVEL");
    if (!level) {
        spdlog::set_level(spdlog::level::info);
        return;
    }
    auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off; only accept "off" when asked for
    if (parsed == spdlog::level::off && std::string(level) != "off") {
        spdlog::warn("Unknown EXEC_KERNEL_LOG_LEVEL '{}', keeping info", level);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}

} // namespace exec_kernel
