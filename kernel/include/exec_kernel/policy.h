#pragma once

#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace exec_kernel {

/// Process-wide import policy for guarded runs. Default deny: a third-party
/// top-level package loads only if it is on the allow-list. Read-only after
/// static initialization, so concurrent lookups need no locking.
class PolicyTable {
public:
    /// True if the top-level package may be imported.
    static bool is_allowed(const std::string& top_level);

    /// Package-manager name for a top-level package (override, else identity).
    static std::string resolve_install_name(const std::string& top_level);

    /// Platform-only or legacy names that are never auto-installed.
    static bool is_install_exempt(const std::string& top_level);

    /// Top-level package for a dotted module path, honoring the multi-segment
    /// families in package_families().
    static std::string top_level_package(const std::string& module_name);

    static const std::set<std::string>& allowed_modules();
    static const std::map<std::string, std::string>& name_overrides();
    static const std::set<std::string>& install_exceptions();

    /// (prefix, top-level) pairs checked in order before the first-segment rule.
    static const std::vector<std::pair<std::string, std::string>>& package_families();
};

} // namespace exec_kernel
