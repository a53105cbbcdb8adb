#include "exec_kernel/script.h"

#include "exec_kernel/policy.h"

#include <cstdio>
#include <sstream>

namespace exec_kernel {

namespace {

// Runtime half of the import policy. Every import, including transitive,
// relative and importlib.import_module() ones, reaches authorize().
const char* const kPolicyRuntime = R"PY(
_original_import = builtins.__import__
_original_open = builtins.open
_original_io_open = io.open
_original_file_io = io.FileIO
_guard_state = threading.local()
_stdlib_cache = {}
_install_attempted = set()


def top_level_package(name):
    for prefix, top in PACKAGE_FAMILIES:
        if name.startswith(prefix):
            return top
    return name.split(".")[0]


def is_standard_library(package_name):
    cached = _stdlib_cache.get(package_name)
    if cached is not None:
        return cached
    result = _probe_standard_library(package_name)
    _stdlib_cache[package_name] = result
    return result


def _probe_standard_library(package_name):
    if package_name.startswith("_"):
        return True
    if package_name in STANDARD_LIB_MODULES or package_name in STDLIB_NAMES:
        return True
    try:
        spec = importlib.util.find_spec(package_name)
    except (ImportError, ValueError):
        return False
    if spec is None or not spec.origin:
        return False
    origin = spec.origin
    if origin in ("built-in", "frozen"):
        return True
    if "site-packages" in origin or "dist-packages" in origin:
        return False
    return origin.startswith(STDLIB_PATH) or "/lib/python" in origin


def is_package_installed(package_name):
    # Probing must not itself trigger policy checks or installs
    previous = getattr(_guard_state, "busy", False)
    _guard_state.busy = True
    try:
        return importlib.util.find_spec(package_name) is not None
    except (ImportError, ValueError):
        return False
    finally:
        _guard_state.busy = previous


def install_package(name, alt_name):
    env = dict(os.environ)
    candidates = [name]
    if alt_name and alt_name != name:
        candidates.append(alt_name)
    for attempt, candidate in enumerate(candidates):
        if attempt == 0:
            print(f"Installing {candidate}... This may take a moment.")
        else:
            print(f"Trying to install as {candidate}... This may take a moment.")
        cmd = [sys.executable, "-m", "pip", "install", "--no-cache-dir", "--quiet", candidate]
        try:
            subprocess.check_call(cmd, env=env, stdin=subprocess.DEVNULL, timeout=INSTALL_TIMEOUT)
        except Exception as e:
            print(f"\033[31mFailed to install '{candidate}'\033[0m: {e}")
            continue
        importlib.invalidate_caches()
        print(f"Successfully installed {candidate}")
        return True
    return False


def ensure_dependency(package_name, module_name):
    if package_name in INSTALL_EXCEPTIONS or package_name in _install_attempted:
        return
    if is_package_installed(package_name):
        return
    _install_attempted.add(package_name)
    install_name = PACKAGE_NAME_OVERRIDES.get(package_name, package_name)
    full_name = PACKAGE_NAME_OVERRIDES.get(module_name, module_name)
    print(f"Package '{package_name}' not found. Attempting to install...")
    if not install_package(install_name, "-".join(full_name.split(".")[:2])):
        print(f"Package '{install_name}' is not available and couldn't be installed.")


def authorize(module_name, requested_name):
    if getattr(_guard_state, "busy", False):
        return
    _guard_state.busy = True
    try:
        package_name = top_level_package(module_name)
        if is_standard_library(package_name):
            return
        if package_name in ALLOWED_PACKAGES:
            ensure_dependency(package_name, module_name)
            return
    finally:
        _guard_state.busy = False
    sys.stderr.write(
        f"SecurityError: Import of '{package_name}' (from '{requested_name}') is not allowed\n"
    )
    raise ImportError(f"Blocked import: '{package_name}' (from '{requested_name}')")


def _resolve_name(name, globals_dict, level):
    if level > 0 and globals_dict:
        package = globals_dict.get("__package__")
        if package:
            base = package.rsplit(".", level - 1)[0]
            return f"{base}.{name}" if name else base
    return name


def secure_import(name, globals=None, locals=None, fromlist=(), level=0):
    resolved = _resolve_name(name, globals, level)
    if not top_level_package(resolved):
        print(f"Import warning: Empty package name detected in import of '{name}'")
        return None
    if resolved == "org.python.core":
        return None
    authorize(resolved, name)
    return _original_import(name, globals, locals, fromlist, level)


class _PolicyFinder:
    """Backstop for loads that do not pass through builtins.__import__."""

    @staticmethod
    def find_spec(fullname, path=None, target=None):
        authorize(fullname, fullname)
        return None


class ImportGuard:
    def __enter__(self):
        sys.meta_path.insert(0, _PolicyFinder)
        builtins.__import__ = secure_import
        return self

    def __exit__(self, *exc_info):
        builtins.__import__ = _original_import
        if _PolicyFinder in sys.meta_path:
            sys.meta_path.remove(_PolicyFinder)
        return False
)PY";

const char* const kWriteGuard = R"PY(

def _is_write_mode(mode):
    return isinstance(mode, str) and any(flag in mode for flag in "wax+")


def safe_open(file, mode="r", *args, **kwargs):
    if _is_write_mode(mode):
        sys.stderr.write(f"SecurityError: Writing to files is not allowed ({file!r}, mode {mode!r})\n")
        return None
    return _original_open(file, mode, *args, **kwargs)


class SafeFileIO(_original_file_io):
    # Refused writes raise PermissionError
    def __init__(self, file, mode="r", *args, **kwargs):
        if _is_write_mode(mode):
            sys.stderr.write(f"SecurityError: Writing to files is not allowed ({file!r}, mode {mode!r})\n")
            raise PermissionError(f"Writing to files is not allowed: {file!r}")
        super().__init__(file, mode, *args, **kwargs)


class WriteGuard:
    def __init__(self, enabled):
        self.enabled = enabled

    def __enter__(self):
        if self.enabled:
            builtins.open = safe_open
            io.open = safe_open
            io.FileIO = SafeFileIO
        return self

    def __exit__(self, *exc_info):
        builtins.open = _original_open
        io.open = _original_io_open
        io.FileIO = _original_file_io
        return False
)PY";

const char* const kOutputCapture = R"PY(

class OutputCapture:
    def __enter__(self):
        self._saved = (sys.stdout, sys.stderr)
        self.stdout = io.StringIO()
        self.stderr = io.StringIO()
        sys.stdout, sys.stderr = self.stdout, self.stderr
        return self

    def __exit__(self, *exc_info):
        sys.stdout, sys.stderr = self._saved
        output = self.stdout.getvalue()
        error = self.stderr.getvalue()
        if output:
            sys.stdout.write(output if output.endswith("\n") else output + "\n")
        if error:
            sys.stderr.write(error)
        sys.stdout.flush()
        sys.stderr.flush()
        return False
)PY";

const char* const kPlotSupport = R"PY(

def prepare_plotting():
    if not is_package_installed("matplotlib"):
        print("Warning: Matplotlib setup failed: matplotlib is not installed")
        return None
    try:
        import matplotlib

        matplotlib.use("Agg")
        import matplotlib.pyplot

        builtins.plt = matplotlib.pyplot
        print("Matplotlib initialized successfully in non-interactive mode.")
        return matplotlib.pyplot
    except ImportError as e:
        print(f"Warning: Matplotlib setup failed: {e}")
    except Exception as e:
        print(f"Warning: Error during matplotlib initialization: {e}")
    return None


def save_figures(pyplot):
    saved_files = []
    if pyplot is None:
        return saved_files
    try:
        for index, fignum in enumerate(pyplot.get_fignums()):
            filename = f"plot_{index}.png"
            try:
                pyplot.figure(fignum).savefig(os.path.join(PLOT_DIR, filename), bbox_inches="tight")
                saved_files.append(filename)
            except Exception as e:
                print(f"Warning: could not save figure {fignum}: {e}")
        pyplot.close("all")
    except Exception as e:
        print(f"Warning: figure export failed: {e}")
    return saved_files
)PY";

template <typename Container>
std::string python_set(const Container& names) {
    std::ostringstream out;
    out << "frozenset({";
    bool first = true;
    for (const auto& name : names) {
        if (!first) out << ", ";
        out << ScriptSynthesizer::quote(name);
        first = false;
    }
    out << "})";
    return out.str();
}

std::string python_bool(bool value) {
    return value ? "True" : "False";
}

} // anonymous namespace

std::string ScriptSynthesizer::quote(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '\'';
    for (unsigned char c : text) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\'': out += "\\'"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20 || c == 0x7f) {
                    char buf[5];
                    std::snprintf(buf, sizeof(buf), "\\x%02x", c);
                    out += buf;
                } else {
                    out += static_cast<char>(c);
                }
        }
    }
    out += '\'';
    return out;
}

std::string ScriptSynthesizer::indent_code(const std::string& code, const std::string& indent) {
    std::string out;
    std::istringstream lines(code);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out += indent;
        out += line;
        out += '\n';
    }
    return out;
}

std::string ScriptSynthesizer::synthesize(const std::string& code, const ScriptOptions& options) {
    std::ostringstream script;

    script << "import builtins\n"
              "import importlib\n"
              "import importlib.util\n"
              "import io\n"
              "import os\n"
              "import subprocess\n"
              "import sys\n"
              "import threading\n"
              "import traceback\n"
              "\n"
              "STANDARD_LIB_MODULES = sys.builtin_module_names\n"
              "STDLIB_NAMES = getattr(sys, \"stdlib_module_names\", frozenset())\n"
              "STDLIB_PATH = os.path.dirname(os.__file__)\n";

    script << "ENABLE_WRITE_GUARD = " << python_bool(options.write_guard) << "\n";
    script << "CAPTURE_PLOTS = " << python_bool(options.capture_plots) << "\n";
    script << "PLOT_DIR = " << quote(options.plot_dir.empty() ? "." : options.plot_dir) << "\n";
    script << "INSTALL_TIMEOUT = " << options.install_timeout_seconds << "\n";
    script << "ALLOWED_PACKAGES = " << python_set(PolicyTable::allowed_modules()) << "\n";
    script << "INSTALL_EXCEPTIONS = " << python_set(PolicyTable::install_exceptions()) << "\n";

    script << "PACKAGE_NAME_OVERRIDES = {\n";
    for (const auto& [from, to] : PolicyTable::name_overrides()) {
        script << "    " << quote(from) << ": " << quote(to) << ",\n";
    }
    script << "}\n";

    script << "PACKAGE_FAMILIES = (\n";
    for (const auto& [prefix, top] : PolicyTable::package_families()) {
        script << "    (" << quote(prefix) << ", " << quote(top) << "),\n";
    }
    script << ")\n";

    script << kPolicyRuntime << kWriteGuard << kOutputCapture;
    if (options.capture_plots) {
        script << kPlotSupport;
    }

    // Guarded block at module level so `from x import *` stays legal.
    script << "\n\n"
              "with OutputCapture():\n"
              "    with ImportGuard():\n"
              "        _plot_backend = prepare_plotting() if CAPTURE_PLOTS else None\n"
              "        with WriteGuard(ENABLE_WRITE_GUARD):\n"
              "            try:\n";
    script << indent_code(code, "                ");
    script << "                pass\n"
              "            except Exception as _user_error:\n"
              "                print(f\"Error: {type(_user_error).__name__}: {_user_error}\")\n"
              "                traceback.print_exc(file=sys.stderr)\n";
    if (options.capture_plots) {
        script << "        _saved_plots = save_figures(_plot_backend)\n"
                  "        if _saved_plots:\n"
                  "            print(\"\\nPlots saved to files: \" + \", \".join(_saved_plots))\n";
    }

    return script.str();
}

} // namespace exec_kernel
