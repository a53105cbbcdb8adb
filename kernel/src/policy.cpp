#include "exec_kernel/policy.h"

namespace exec_kernel {

const std::set<std::string>& PolicyTable::allowed_modules() {
    static const std::set<std::string> modules = {
        // Standard modules that are listed explicitly as well
        "abc", "codecs", "collections", "datetime", "functools", "genericpath",
        "importlib", "io", "json", "logging", "mimetypes", "ntpath", "os",
        "pathlib", "posixpath", "random", "re", "runpy", "stat", "textwrap",
        "tkinter", "typing", "weakref", "zipimport", "zlib",

        // Legacy and platform specific names
        "cPickle", "msvcrt", "nt", "pickle5", "urllib2", "winreg",

        // Text, encoding and parsing
        "babel", "bs4", "chardet", "charset_normalizer", "defusedxml", "docutils",
        "idna", "jinja2", "Levenshtein", "markupsafe", "pygments", "pyparsing",
        "rapidfuzz", "simplejson", "tabulate", "wcwidth", "yaml",

        // Numerics and data analysis
        "numpy", "pandas", "patsy", "pyarrow", "scikits", "scipy", "sklearn",
        "sksparse", "statsmodels", "sympy", "tzdata", "uarray",
        "dateutil", "pytz", "networkx",

        // Visualization and imaging
        "contourpy", "cycler", "fontTools", "kiwisolver", "matplotlib",
        "mpl_toolkits", "mpl_toolkits.basemap", "PIL", "plotly", "png",
        "qrcode", "seaborn", "svgwrite",

        // Geospatial
        "geopandas", "pyproj", "shapely",

        // Networking
        "api", "certifi", "requests", "socks", "urllib3",

        // Compression
        "brotli", "brotlicffi", "zstandard",

        // Tooling, introspection and interactive environments
        "astroid", "asttokens", "backports_abc", "colorama", "comm", "ctags",
        "cython", "Cython", "decorator", "docrepr", "executing", "IPython",
        "ipywidgets", "jedi", "packaging", "parso", "prompt_toolkit",
        "pure_eval", "pydantic", "six", "sphinx", "stack_data", "tqdm",
        "traitlets", "typing_extensions",

        // GUI toolkits
        "gi", "PyQt5", "PyQt6", "PySide2", "PySide6", "wx",
    };
    return modules;
}

const std::map<std::string, std::string>& PolicyTable::name_overrides() {
    static const std::map<std::string, std::string> overrides = {
        {"bs4", "beautifulsoup4"},
        {"PIL", "Pillow"},
        {"yaml", "PyYAML"},
        {"scikits.umfpack", "scikit-umfpack"},
        {"sksparse.cholmod", "scikit-sparse"},
        {"png", "pypng"},
        {"mpl_toolkits.basemap", "basemap"},
        {"mpl_toolkits", "matplotlib"},
    };
    return overrides;
}

const std::set<std::string>& PolicyTable::install_exceptions() {
    static const std::set<std::string> exceptions = {
        "nt", "winreg", "msvcrt",       // Windows only
        "cPickle", "pickle5", "urllib2", // superseded in Python 3
        "scikits", "sksparse",           // need native toolchains
    };
    return exceptions;
}

const std::vector<std::pair<std::string, std::string>>& PolicyTable::package_families() {
    static const std::vector<std::pair<std::string, std::string>> families = {
        {"mpl_toolkits.basemap", "mpl_toolkits.basemap"},
        {"mpl_toolkits", "matplotlib"},
    };
    return families;
}

bool PolicyTable::is_allowed(const std::string& top_level) {
    return allowed_modules().count(top_level) != 0;
}

std::string PolicyTable::resolve_install_name(const std::string& top_level) {
    const auto& overrides = name_overrides();
    auto it = overrides.find(top_level);
    return it != overrides.end() ? it->second : top_level;
}

bool PolicyTable::is_install_exempt(const std::string& top_level) {
    return install_exceptions().count(top_level) != 0;
}

std::string PolicyTable::top_level_package(const std::string& module_name) {
    for (const auto& [prefix, top] : package_families()) {
        if (module_name.compare(0, prefix.size(), prefix) == 0) {
            return top;
        }
    }
    return module_name.substr(0, module_name.find('.'));
}

} // namespace exec_kernel
