/*
 * scriptdeck C++ - Isolated Execution Unit Implementation
 *
 * Raw CPython C API. The script gets one globals dict whose __builtins__
 * is a plain dict holding only allow-listed names, plus two functions
 * implemented here: input() over the Input Emulator and __import__
 * guarded by the Capability Allowlist.
 */
#define PY_SSIZE_T_CLEAN
#include <Python.h>

#include <scriptdeck/sandbox/python_unit.hpp>
#include <scriptdeck/sandbox/capabilities.hpp>
#include <scriptdeck/core/logger.hpp>
#include <scriptdeck/core/utils.hpp>

#include <cstdint>

namespace scriptdeck {

namespace {

const char* const UNIT_CAPSULE_NAME = "scriptdeck.unit";
const char* const SCRIPT_FILENAME = "<script>";
const char* const SCRIPT_MODULE_NAME = "__script__";
const int MAX_JSON_DEPTH = 64;

// ============ String helpers ============

std::string unicode_to_string(PyObject* obj) {
    Py_ssize_t size = 0;
    const char* data = PyUnicode_AsUTF8AndSize(obj, &size);
    if (data) return std::string(data, static_cast<size_t>(size));
    
    // Lone surrogates cannot be encoded strictly
    PyErr_Clear();
    PyObject* bytes = PyUnicode_AsEncodedString(obj, "utf-8", "backslashreplace");
    if (!bytes) {
        PyErr_Clear();
        return std::string();
    }
    std::string out(PyBytes_AS_STRING(bytes), static_cast<size_t>(PyBytes_GET_SIZE(bytes)));
    Py_DECREF(bytes);
    return out;
}

std::string object_str(PyObject* obj) {
    PyObject* s = PyObject_Str(obj);
    if (!s) {
        PyErr_Clear();
        return "<unprintable object>";
    }
    std::string out = unicode_to_string(s);
    Py_DECREF(s);
    return out;
}

std::string object_repr(PyObject* obj) {
    PyObject* r = PyObject_Repr(obj);
    if (!r) {
        PyErr_Clear();
        return "<unrepresentable object>";
    }
    std::string out = unicode_to_string(r);
    Py_DECREF(r);
    return out;
}

std::string fetch_error_string() {
    PyObject *type = NULL, *value = NULL, *tb = NULL;
    PyErr_Fetch(&type, &value, &tb);
    std::string out = value ? object_str(value) : (type ? object_repr(type) : "unknown error");
    Py_XDECREF(type);
    Py_XDECREF(value);
    Py_XDECREF(tb);
    return out;
}

PythonUnit* unit_from_capsule(PyObject* capsule) {
    return static_cast<PythonUnit*>(PyCapsule_GetPointer(capsule, UNIT_CAPSULE_NAME));
}

// ============ Return value conversion ============

Json to_json_value(PyObject* obj, int depth) {
    if (obj == Py_None) return Json(nullptr);
    if (PyBool_Check(obj)) return Json(obj == Py_True);
    
    if (PyLong_Check(obj)) {
        int overflow = 0;
        long long v = PyLong_AsLongLongAndOverflow(obj, &overflow);
        if (overflow == 0 && !(v == -1 && PyErr_Occurred())) {
            return Json(static_cast<int64_t>(v));
        }
        PyErr_Clear();
        return Json(object_repr(obj));
    }
    
    if (PyFloat_Check(obj)) return Json(PyFloat_AsDouble(obj));
    if (PyUnicode_Check(obj)) return Json(unicode_to_string(obj));
    
    if (depth < MAX_JSON_DEPTH && (PyList_Check(obj) || PyTuple_Check(obj))) {
        Json arr = Json::array();
        Py_ssize_t n = PySequence_Fast_GET_SIZE(obj);
        for (Py_ssize_t i = 0; i < n; ++i) {
            arr.push_back(to_json_value(PySequence_Fast_GET_ITEM(obj, i), depth + 1));
        }
        return arr;
    }
    
    if (depth < MAX_JSON_DEPTH && PyDict_Check(obj)) {
        Json out = Json::object();
        PyObject *key, *value;
        Py_ssize_t pos = 0;
        while (PyDict_Next(obj, &pos, &key, &value)) {
            if (!PyUnicode_Check(key)) {
                return Json(object_repr(obj));
            }
            out[unicode_to_string(key)] = to_json_value(value, depth + 1);
        }
        return out;
    }
    
    return Json(object_repr(obj));
}

// A plain function (or bound method) is only called when every parameter
// has a default. Other callables are called as they are.
bool accepts_no_arguments(PyObject* callable) {
    PyObject* func = callable;
    int bound = 0;
    if (PyMethod_Check(callable)) {
        func = PyMethod_GET_FUNCTION(callable);
        bound = 1;
    }
    if (!PyFunction_Check(func)) return true;
    
    PyCodeObject* code = reinterpret_cast<PyCodeObject*>(PyFunction_GET_CODE(func));
    PyObject* defaults = PyFunction_GET_DEFAULTS(func);
    PyObject* kw_defaults = PyFunction_GET_KW_DEFAULTS(func);
    
    Py_ssize_t positional = code->co_argcount - bound;
    Py_ssize_t n_defaults = defaults ? PyTuple_GET_SIZE(defaults) : 0;
    Py_ssize_t kw_only = code->co_kwonlyargcount;
    Py_ssize_t n_kw_defaults = kw_defaults ? PyDict_Size(kw_defaults) : 0;
    
    return positional - n_defaults <= 0 && kw_only - n_kw_defaults <= 0;
}

// ============ Capture stream type ============

struct CaptureStream {
    PyObject_HEAD
    OutputSink* sink;
    int stream;
};

PyObject* capture_write(PyObject* self, PyObject* arg) {
    CaptureStream* cs = reinterpret_cast<CaptureStream*>(self);
    if (!PyUnicode_Check(arg)) {
        PyErr_Format(PyExc_TypeError, "write() argument must be str, not %.100s",
                     Py_TYPE(arg)->tp_name);
        return NULL;
    }
    cs->sink->write(static_cast<FrameType>(cs->stream), unicode_to_string(arg));
    return PyLong_FromSsize_t(PyUnicode_GetLength(arg));
}

PyObject* capture_flush(PyObject* self, PyObject*) {
    CaptureStream* cs = reinterpret_cast<CaptureStream*>(self);
    cs->sink->flush(static_cast<FrameType>(cs->stream));
    Py_RETURN_NONE;
}

PyObject* capture_false(PyObject*, PyObject*) {
    Py_RETURN_FALSE;
}

PyObject* capture_true(PyObject*, PyObject*) {
    Py_RETURN_TRUE;
}

PyObject* capture_encoding(PyObject*, void*) {
    return PyUnicode_FromString("utf-8");
}

PyMethodDef capture_methods[] = {
    {"write", capture_write, METH_O, "Append text to the captured stream."},
    {"flush", capture_flush, METH_NOARGS, "Send buffered text."},
    {"isatty", capture_false, METH_NOARGS, NULL},
    {"writable", capture_true, METH_NOARGS, NULL},
    {"readable", capture_false, METH_NOARGS, NULL},
    {NULL, NULL, 0, NULL}
};

PyGetSetDef capture_getset[] = {
    {const_cast<char*>("encoding"), capture_encoding, NULL, NULL, NULL},
    {NULL, NULL, NULL, NULL, NULL}
};

PyType_Slot capture_slots[] = {
    {Py_tp_methods, capture_methods},
    {Py_tp_getset, capture_getset},
    {Py_tp_doc, const_cast<char*>("Captured output stream of a sandboxed script")},
    {0, NULL}
};

PyType_Spec capture_spec = {
    "scriptdeck.CaptureStream",
    static_cast<int>(sizeof(CaptureStream)),
    0,
    Py_TPFLAGS_DEFAULT,
    capture_slots
};

// ============ Injected built-ins ============

PyObject* sandbox_input(PyObject* self, PyObject* args) {
    PythonUnit* unit = unit_from_capsule(self);
    if (!unit) return NULL;
    
    PyObject* prompt_obj = NULL;
    if (!PyArg_ParseTuple(args, "|O:input", &prompt_obj)) return NULL;
    
    std::string prompt;
    if (prompt_obj && prompt_obj != Py_None) {
        PyObject* s = PyObject_Str(prompt_obj);
        if (!s) return NULL;
        prompt = unicode_to_string(s);
        Py_DECREF(s);
    }
    
    std::string line;
    if (!unit->read_line(prompt, line)) {
        PyErr_SetString(PyExc_EOFError, END_OF_INPUT_MESSAGE);
        return NULL;
    }
    return PyUnicode_DecodeUTF8(line.data(), static_cast<Py_ssize_t>(line.size()), "replace");
}

PyObject* sandbox_import(PyObject* self, PyObject* args, PyObject* kwargs) {
    PythonUnit* unit = unit_from_capsule(self);
    if (!unit) return NULL;
    
    static const char* kwlist[] = {"name", "globals", "locals", "fromlist", "level", NULL};
    PyObject* name = NULL;
    PyObject* globals = NULL;
    PyObject* locals = NULL;
    PyObject* fromlist = NULL;
    int level = 0;
    if (!PyArg_ParseTupleAndKeywords(args, kwargs, "U|OOOi:__import__",
                                     const_cast<char**>(kwlist),
                                     &name, &globals, &locals, &fromlist, &level)) {
        return NULL;
    }
    
    std::vector<std::string> imported_names;
    if (fromlist && fromlist != Py_None) {
        PyObject* seq = PySequence_Fast(fromlist, "fromlist must be a sequence");
        if (!seq) return NULL;
        Py_ssize_t n = PySequence_Fast_GET_SIZE(seq);
        for (Py_ssize_t i = 0; i < n; ++i) {
            PyObject* item = PySequence_Fast_GET_ITEM(seq, i);
            if (PyUnicode_Check(item)) {
                imported_names.push_back(unicode_to_string(item));
            }
        }
        Py_DECREF(seq);
    }
    
    std::string module_name = unicode_to_string(name);
    ImportDecision decision =
        CapabilityAllowlist::instance().resolve_import(module_name, imported_names, level);
    if (!decision.allowed) {
        LOG_DEBUG("[Worker] Denied import of '%s'", decision.denied_name.c_str());
        PyErr_SetString(PyExc_ImportError, decision.reason.c_str());
        return NULL;
    }
    
    return PyObject_Call(unit->real_import(), args, kwargs);
}

PyMethodDef input_def = {
    "input", sandbox_input, METH_VARARGS,
    "Read a line from the request's standard input."
};

PyMethodDef import_def = {
    "__import__", reinterpret_cast<PyCFunction>(reinterpret_cast<void (*)(void)>(sandbox_import)),
    METH_VARARGS | METH_KEYWORDS,
    "Import a module permitted for sandboxed scripts."
};

} // anonymous namespace

// ============================================================================
// PythonUnit
// ============================================================================

PythonUnit::PythonUnit(const WorkerRequest& request, OutputSink& sink)
    : request_(request)
    , sink_(sink)
    , input_(request.stdin_text)
    , real_import_(NULL)
    , traceback_module_(NULL)
    , capsule_(NULL)
    , initialized_(false) {}

// The interpreter is never finalized: finalizers could run script code
// after the result has been reported. Process exit reclaims everything.
PythonUnit::~PythonUnit() {}

bool PythonUnit::initialize(std::string& error) {
    PyPreConfig preconfig;
    PyPreConfig_InitIsolatedConfig(&preconfig);
    preconfig.utf8_mode = 1;
    
    PyStatus status = Py_PreInitialize(&preconfig);
    if (PyStatus_Exception(status)) {
        error = std::string("Interpreter pre-initialization failed: ") +
                (status.err_msg ? status.err_msg : "unknown");
        return false;
    }
    
    PyConfig config;
    PyConfig_InitIsolatedConfig(&config);
    config.site_import = 0;
    config.user_site_directory = 0;
    config.write_bytecode = 0;
    config.install_signal_handlers = 0;
    
    status = Py_InitializeFromConfig(&config);
    PyConfig_Clear(&config);
    if (PyStatus_Exception(status)) {
        error = std::string("Interpreter initialization failed: ") +
                (status.err_msg ? status.err_msg : "unknown");
        return false;
    }
    initialized_ = true;
    
    // Host-side modules, loaded while the filesystem is still open
    traceback_module_ = PyImport_ImportModule("traceback");
    if (!traceback_module_) {
        error = "Cannot load traceback module: " + fetch_error_string();
        return false;
    }
    
    PyObject* builtins_module = PyImport_ImportModule("builtins");
    if (!builtins_module) {
        error = "Cannot load builtins module: " + fetch_error_string();
        return false;
    }
    real_import_ = PyObject_GetAttrString(builtins_module, "__import__");
    Py_DECREF(builtins_module);
    if (!real_import_) {
        error = "Cannot resolve __import__: " + fetch_error_string();
        return false;
    }
    
    capsule_ = PyCapsule_New(this, UNIT_CAPSULE_NAME, NULL);
    if (!capsule_) {
        error = "Cannot create unit capsule: " + fetch_error_string();
        return false;
    }
    
    if (!install_capture_streams()) {
        error = "Cannot install capture streams: " + fetch_error_string();
        return false;
    }
    
    LOG_DEBUG("[Worker] Interpreter initialized (Python %s)", Py_GetVersion());
    return true;
}

bool PythonUnit::install_capture_streams() {
    PyObject* type = PyType_FromSpec(&capture_spec);
    if (!type) return false;
    
    const FrameType streams[] = {FrameType::STDOUT, FrameType::STDERR};
    const char* names[] = {"stdout", "stderr"};
    
    for (int i = 0; i < 2; ++i) {
        PyObject* obj = PyType_GenericAlloc(reinterpret_cast<PyTypeObject*>(type), 0);
        if (!obj) {
            Py_DECREF(type);
            return false;
        }
        CaptureStream* cs = reinterpret_cast<CaptureStream*>(obj);
        cs->sink = &sink_;
        cs->stream = static_cast<int>(streams[i]);
        
        int rc = PySys_SetObject(names[i], obj);
        Py_DECREF(obj);
        if (rc != 0) {
            Py_DECREF(type);
            return false;
        }
    }
    
    Py_DECREF(type);
    return true;
}

std::vector<std::string> PythonUnit::library_paths() const {
    std::vector<std::string> paths;
    if (!initialized_) return paths;
    
    const char* prefixes[] = {"prefix", "exec_prefix", "base_prefix", "base_exec_prefix", NULL};
    for (int i = 0; prefixes[i] != NULL; ++i) {
        PyObject* value = PySys_GetObject(prefixes[i]);  // borrowed
        if (value && PyUnicode_Check(value)) {
            std::string dir = unicode_to_string(value);
            if (!dir.empty() && is_directory(dir)) paths.push_back(dir);
        }
    }
    
    PyObject* sys_path = PySys_GetObject("path");  // borrowed
    if (sys_path && PyList_Check(sys_path)) {
        Py_ssize_t n = PyList_GET_SIZE(sys_path);
        for (Py_ssize_t i = 0; i < n; ++i) {
            PyObject* item = PyList_GET_ITEM(sys_path, i);
            if (!PyUnicode_Check(item)) continue;
            std::string dir = unicode_to_string(item);
            if (!dir.empty() && is_directory(dir)) paths.push_back(dir);
        }
    }
    return paths;
}

bool PythonUnit::read_line(const std::string& prompt, std::string& line) {
    std::string echo;
    bool got = input_.next_line(prompt, line, echo);
    if (!echo.empty()) {
        sink_.write(FrameType::STDOUT, echo);
    }
    return got;
}

PyObject* PythonUnit::build_builtins() {
    PyObject* builtins_module = PyImport_ImportModule("builtins");
    if (!builtins_module) return NULL;
    PyObject* real = PyModule_GetDict(builtins_module);  // borrowed
    
    PyObject* restricted = PyDict_New();
    if (!restricted) {
        Py_DECREF(builtins_module);
        return NULL;
    }
    
    const std::vector<std::string>& names = CapabilityAllowlist::instance().builtins();
    for (size_t i = 0; i < names.size(); ++i) {
        PyObject* item = PyDict_GetItemString(real, names[i].c_str());  // borrowed
        if (item && PyDict_SetItemString(restricted, names[i].c_str(), item) != 0) {
            Py_DECREF(restricted);
            Py_DECREF(builtins_module);
            return NULL;
        }
    }
    Py_DECREF(builtins_module);
    
    PyObject* input_fn = PyCFunction_NewEx(&input_def, capsule_, NULL);
    PyObject* import_fn = PyCFunction_NewEx(&import_def, capsule_, NULL);
    if (!input_fn || !import_fn ||
        PyDict_SetItemString(restricted, "input", input_fn) != 0 ||
        PyDict_SetItemString(restricted, "__import__", import_fn) != 0) {
        Py_XDECREF(input_fn);
        Py_XDECREF(import_fn);
        Py_DECREF(restricted);
        return NULL;
    }
    Py_DECREF(input_fn);
    Py_DECREF(import_fn);
    return restricted;
}

bool PythonUnit::evaluate(PyObject* globals, WorkerReport& report) {
    if (request_.source_text.find('\0') != std::string::npos) {
        PyErr_SetString(PyExc_ValueError, "source code string cannot contain null bytes");
        return false;
    }
    
    PyObject* code = Py_CompileString(request_.source_text.c_str(), SCRIPT_FILENAME, Py_file_input);
    if (!code) return false;
    
    PyObject* result = PyEval_EvalCode(code, globals, globals);
    Py_DECREF(code);
    if (!result) return false;
    Py_DECREF(result);
    
    PyObject* entry = PyDict_GetItemString(globals, request_.entry_point.c_str());  // borrowed
    if (entry && PyCallable_Check(entry)) {
        if (!accepts_no_arguments(entry)) {
            LOG_DEBUG("[Worker] '%s' requires arguments, not called", request_.entry_point.c_str());
        } else {
            Py_INCREF(entry);
            PyObject* value = PyObject_CallNoArgs(entry);
            Py_DECREF(entry);
            if (!value) return false;
            
            report.has_return_value = true;
            report.return_value = to_json_value(value, 0);
            Py_DECREF(value);
        }
    }
    
    report.success = true;
    return true;
}

WorkerReport PythonUnit::run() {
    WorkerReport report;
    if (!initialized_) {
        report.error = "Interpreter not initialized";
        return report;
    }
    
    PyObject* builtins = build_builtins();
    PyObject* globals = PyDict_New();
    PyObject* module_name = PyUnicode_FromString(SCRIPT_MODULE_NAME);
    
    bool ready = builtins && globals && module_name &&
                 PyDict_SetItemString(globals, "__builtins__", builtins) == 0 &&
                 PyDict_SetItemString(globals, "__name__", module_name) == 0 &&
                 PyDict_SetItemString(globals, "__doc__", Py_None) == 0;
    
    if (!ready || !evaluate(globals, report)) {
        report.success = false;
        report.has_return_value = false;
        report.return_value = nullptr;
        report_exception(report);
    }
    
    Py_XDECREF(module_name);
    Py_XDECREF(globals);
    Py_XDECREF(builtins);
    
    sink_.flush_all();
    return report;
}

void PythonUnit::report_exception(WorkerReport& report) {
    PyObject *type = NULL, *value = NULL, *tb = NULL;
    PyErr_Fetch(&type, &value, &tb);
    if (!type) {
        report.error = "Unknown error";
        return;
    }
    PyErr_NormalizeException(&type, &value, &tb);
    if (value && tb) {
        PyException_SetTraceback(value, tb);
    }
    
    std::string type_name = "Exception";
    PyObject* name = PyObject_GetAttrString(type, "__name__");
    if (name) {
        if (PyUnicode_Check(name)) type_name = unicode_to_string(name);
        Py_DECREF(name);
    } else {
        PyErr_Clear();
    }
    
    std::string message = value ? object_str(value) : std::string();
    report.error = message.empty() ? type_name : type_name + ": " + message;
    
    sink_.write(FrameType::STDERR, format_traceback(type, value, tb));
    
    Py_XDECREF(type);
    Py_XDECREF(value);
    Py_XDECREF(tb);
}

std::string PythonUnit::format_traceback(PyObject* type, PyObject* value, PyObject* tb) {
    std::string fallback = "Traceback unavailable\n";
    if (!traceback_module_) return fallback;
    
    PyObject* lines = PyObject_CallMethod(traceback_module_, "format_exception", "OOO",
                                          type,
                                          value ? value : Py_None,
                                          tb ? tb : Py_None);
    if (!lines) {
        PyErr_Clear();
        return fallback;
    }
    
    std::string out;
    PyObject* seq = PySequence_Fast(lines, "format_exception result");
    if (seq) {
        Py_ssize_t n = PySequence_Fast_GET_SIZE(seq);
        for (Py_ssize_t i = 0; i < n; ++i) {
            PyObject* item = PySequence_Fast_GET_ITEM(seq, i);
            if (PyUnicode_Check(item)) out += unicode_to_string(item);
        }
        Py_DECREF(seq);
    } else {
        PyErr_Clear();
    }
    Py_DECREF(lines);
    
    return out.empty() ? fallback : out;
}

} // namespace scriptdeck
