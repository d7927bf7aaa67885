/*
 * scriptdeck C++ - Isolated Execution Unit (embedded CPython)
 *
 * Hosts the interpreter inside the worker process:
 *   1. initialize()    - isolated interpreter, capture streams on sys.stdout/err
 *   2. library_paths() - what the Landlock ruleset must keep readable
 *   3. run()           - restricted namespace, evaluate, call main()
 *
 * Everything the script raises ends up in the returned WorkerReport; the
 * formatted traceback goes to the captured stderr.
 */
#ifndef scriptdeck_SANDBOX_PYTHON_UNIT_HPP
#define scriptdeck_SANDBOX_PYTHON_UNIT_HPP

#include <scriptdeck/sandbox/types.hpp>
#include <scriptdeck/sandbox/input_emulator.hpp>
#include <scriptdeck/sandbox/output_sink.hpp>
#include <string>
#include <vector>

struct _object;
typedef struct _object PyObject;

namespace scriptdeck {

class PythonUnit {
public:
    PythonUnit(const WorkerRequest& request, OutputSink& sink);
    ~PythonUnit();
    
    bool initialize(std::string& error);
    
    // Interpreter prefix and module search path directories
    std::vector<std::string> library_paths() const;
    
    WorkerReport run();
    
    // Backing for the script's input(): echoes to captured stdout.
    // Returns false when stdin is exhausted.
    bool read_line(const std::string& prompt, std::string& line);
    
    PyObject* real_import() const { return real_import_; }
    
private:
    PythonUnit(const PythonUnit&);
    PythonUnit& operator=(const PythonUnit&);
    
    bool install_capture_streams();
    PyObject* build_builtins();
    bool evaluate(PyObject* globals, WorkerReport& report);
    void report_exception(WorkerReport& report);
    std::string format_traceback(PyObject* type, PyObject* value, PyObject* tb);
    
    const WorkerRequest& request_;
    OutputSink& sink_;
    InputEmulator input_;
    PyObject* real_import_;
    PyObject* traceback_module_;
    PyObject* capsule_;
    bool initialized_;
};

} // namespace scriptdeck

#endif // scriptdeck_SANDBOX_PYTHON_UNIT_HPP
