/*
 * scriptdeck C++ - Capability Allowlist Implementation
 */
#include <scriptdeck/sandbox/capabilities.hpp>

namespace scriptdeck {

namespace {

const char* const ALLOWED_BUILTINS[] = {
    // Output
    "print",
    // Constants
    "True", "False", "None", "NotImplemented", "Ellipsis",
    // Type constructors
    "object", "bool", "int", "float", "complex", "str", "bytes",
    "list", "dict", "set", "frozenset", "tuple", "range", "slice",
    // Class definitions
    "__build_class__", "property", "staticmethod", "classmethod", "super",
    // Arithmetic
    "abs", "divmod", "pow", "round",
    // Sequences and aggregates
    "len", "all", "any", "enumerate", "filter", "map", "max", "min",
    "sorted", "reversed", "sum", "zip", "iter", "next",
    // Conversion and inspection
    "chr", "ord", "bin", "oct", "hex", "format", "repr", "hash",
    "isinstance", "issubclass", "callable",
    // Exception hierarchy
    "BaseException", "Exception", "ArithmeticError", "LookupError",
    "ValueError", "TypeError", "IndexError", "KeyError", "AttributeError",
    "NameError", "ImportError", "RuntimeError", "NotImplementedError",
    "ZeroDivisionError", "OverflowError", "AssertionError", "StopIteration",
    "RecursionError", "EOFError", "UnicodeError", "UnicodeDecodeError",
    "UnicodeEncodeError", "SystemExit", "KeyboardInterrupt", "GeneratorExit",
    "StopAsyncIteration",
    NULL
};

// Operating-system access, process control, filesystem paths, dynamic
// import machinery, raw built-ins, network, native code, introspection.
const char* const DENIED_MODULES[] = {
    "os", "posix", "nt", "sys", "subprocess", "shutil", "builtins",
    "pathlib", "posixpath", "ntpath", "genericpath", "importlib",
    "pkgutil", "zipimport", "runpy", "imp", "site", "sysconfig",
    "io", "codecs", "fileinput", "linecache", "tempfile", "glob",
    "fnmatch", "filecmp", "shelve", "dbm", "sqlite3", "pickle", "marshal",
    "zipfile", "tarfile", "gzip", "bz2", "lzma", "logging",
    "socket", "socketserver", "ssl", "select", "selectors", "asyncio",
    "http", "urllib", "ftplib", "smtplib", "poplib", "imaplib", "telnetlib",
    "xmlrpc", "webbrowser", "multiprocessing", "concurrent", "threading",
    "signal", "ctypes", "mmap", "resource", "fcntl", "termios", "tty",
    "pty", "pwd", "grp", "platform", "gc", "inspect", "code", "codeop",
    "faulthandler", "tracemalloc", "trace",
    NULL
};

std::string top_level_package(const std::string& module_name) {
    size_t dot = module_name.find('.');
    return dot == std::string::npos ? module_name : module_name.substr(0, dot);
}

std::string denial_message(const std::string& name) {
    return "Import of '" + name + "' is not allowed for security reasons";
}

} // anonymous namespace

const CapabilityAllowlist& CapabilityAllowlist::instance() {
    static const CapabilityAllowlist allowlist;
    return allowlist;
}

CapabilityAllowlist::CapabilityAllowlist() {
    for (int i = 0; ALLOWED_BUILTINS[i] != NULL; ++i) {
        builtin_order_.push_back(ALLOWED_BUILTINS[i]);
        builtins_.insert(ALLOWED_BUILTINS[i]);
    }
    for (int i = 0; DENIED_MODULES[i] != NULL; ++i) {
        denied_modules_.insert(DENIED_MODULES[i]);
    }
}

bool CapabilityAllowlist::resolve_builtin(const std::string& name) const {
    return builtins_.count(name) > 0;
}

bool CapabilityAllowlist::is_module_denied(const std::string& module_name) const {
    if (module_name.empty()) return true;
    
    std::string top = top_level_package(module_name);
    if (top.empty() || top[0] == '_') return true;
    
    return denied_modules_.count(module_name) > 0 || denied_modules_.count(top) > 0;
}

ImportDecision CapabilityAllowlist::resolve_import(const std::string& module_name,
                                                   const std::vector<std::string>& imported_names,
                                                   int level) const {
    if (level > 0) {
        return ImportDecision::deny(module_name,
                                    "Relative import of '" + module_name + "' is not allowed");
    }
    
    if (is_module_denied(module_name)) {
        return ImportDecision::deny(module_name, denial_message(module_name));
    }
    
    // "from permitted import denied" must not reach a denied module either
    for (size_t i = 0; i < imported_names.size(); ++i) {
        const std::string& name = imported_names[i];
        if (name == "*") continue;
        if (name.empty() || name[0] == '_' || denied_modules_.count(name) > 0) {
            return ImportDecision::deny(name, denial_message(name));
        }
    }
    
    return ImportDecision::allow();
}

} // namespace scriptdeck
