/*
 * scriptdeck C++ - Script Runner
 *
 * The one entry point callers use: executes source text through the
 * sandbox supervisor and manages saved scripts through the store.
 *
 *   ScriptRunner runner(store, supervisor);
 *   runner.save("Hello", "print('hi')", "Uncategorized", "", {});
 *   ExecutionResult r = runner.execute_saved("Hello", "Uncategorized", "", 0);
 *
 * Script names are reduced to [A-Za-z0-9_-] for the file name; the
 * original name is kept in the metadata. Every read-modify-write of a
 * collection runs under that collection's own mutex.
 */
#ifndef scriptdeck_STORAGE_SCRIPT_RUNNER_HPP
#define scriptdeck_STORAGE_SCRIPT_RUNNER_HPP

#include <scriptdeck/storage/script_store.hpp>
#include <scriptdeck/sandbox/supervisor.hpp>
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>

namespace scriptdeck {

enum class ScriptErrorKind {
    NONE,
    NAME_REJECTED,
    INVALID_COLLECTION_NAME,
    COLLECTION_NOT_FOUND,
    COLLECTION_EXISTS,
    PROTECTED_COLLECTION,
    SCRIPT_NOT_FOUND,
    STORAGE_FAILED
};

const char* error_kind_name(ScriptErrorKind kind);

struct ScriptOpResult {
    bool success;
    ScriptErrorKind error_kind;
    std::string error;
    
    ScriptOpResult() : success(false), error_kind(ScriptErrorKind::NONE) {}
    
    static ScriptOpResult ok() {
        ScriptOpResult r;
        r.success = true;
        return r;
    }
    
    static ScriptOpResult fail(ScriptErrorKind kind, const std::string& err) {
        ScriptOpResult r;
        r.success = false;
        r.error_kind = kind;
        r.error = err;
        return r;
    }
};

struct LoadedScript {
    std::string code;
    ScriptMetadata metadata;
};

class ScriptRunner {
public:
    ScriptRunner(ScriptStore& store, const SandboxSupervisor& supervisor);
    
    // ============ Execution ============
    
    // timeout_seconds <= 0 uses the configured default
    ExecutionResult execute(const std::string& source,
                            const std::string& stdin_text = "",
                            int timeout_seconds = 0) const;
    
    // Load a saved script and run it. A missing script yields a failed
    // result, no worker is started.
    ExecutionResult execute_saved(const std::string& name,
                                  const std::string& collection,
                                  const std::string& stdin_text = "",
                                  int timeout_seconds = 0);
    
    // ============ Scripts ============
    
    ScriptOpResult save(const std::string& name,
                        const std::string& code,
                        const std::string& collection,
                        const std::string& description,
                        const std::vector<std::string>& tags);
    ScriptOpResult load(const std::string& name, const std::string& collection, LoadedScript& out);
    ScriptOpResult remove(const std::string& name, const std::string& collection);
    
    std::vector<ScriptMetadata> list(const std::string& collection);
    std::vector<ScriptMetadata> list_all();
    
    // Case-insensitive substring match on the name or any tag
    std::vector<ScriptMetadata> search(const std::string& query);
    
    // ============ Collections ============
    
    ScriptOpResult create_collection(const std::string& name);
    ScriptOpResult delete_collection(const std::string& name);
    std::vector<std::string> list_collections();
    
    // Keep [A-Za-z0-9_-], drop everything else. May return "".
    static std::string sanitize_name(const std::string& name);
    
    // Number of per-collection mutexes currently tracked
    size_t lock_count();
    
private:
    std::shared_ptr<std::mutex> collection_lock(const std::string& collection);
    void release_collection_lock(const std::string& collection);
    ScriptOpResult check_collection(const std::string& collection);
    
    ScriptStore& store_;
    const SandboxSupervisor& supervisor_;
    
    std::mutex locks_mutex_;
    std::map<std::string, std::shared_ptr<std::mutex> > locks_;
};

} // namespace scriptdeck

#endif // scriptdeck_STORAGE_SCRIPT_RUNNER_HPP
