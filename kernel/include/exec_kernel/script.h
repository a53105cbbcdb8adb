#pragma once

#include <string>

namespace exec_kernel {

struct ScriptOptions {
    bool write_guard = true;            // refuse open() in write/append/update modes
    bool capture_plots = true;          // Agg backend + export open figures
    std::string plot_dir;               // absolute directory figures are saved into
    double install_timeout_seconds = 20; // cap on each package-manager call
};

/// Builds the self-contained Python program run by the child: policy-enforcing
/// import hook, optional write guard and plot context, the caller's code in a
/// guarded block, and output capture that is always restored and emitted.
class ScriptSynthesizer {
public:
    static std::string synthesize(const std::string& code, const ScriptOptions& options = {});

    /// Prefix every line of code with indent. A trailing newline adds no line.
    static std::string indent_code(const std::string& code, const std::string& indent);

    /// Single-quoted Python string literal for arbitrary bytes.
    static std::string quote(const std::string& text);
};

} // namespace exec_kernel
