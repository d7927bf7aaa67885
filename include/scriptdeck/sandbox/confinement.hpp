/*
 * scriptdeck C++ - Process Confinement
 *
 * OS-level restrictions the worker applies to itself before any script
 * code runs. All of them are inherited by anything the script manages to
 * spawn:
 *   - resource limits (address space, CPU, file size, open files, core, procs)
 *   - no_new_privs and a parent-death signal
 *   - private user + network namespace (best effort)
 *   - Landlock ruleset: read-only system library directories, no writes
 *
 * Unsupported kernel features degrade with a warning; the result reports
 * what was actually enforced.
 */
#ifndef scriptdeck_SANDBOX_CONFINEMENT_HPP
#define scriptdeck_SANDBOX_CONFINEMENT_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace scriptdeck {

struct ConfinementOptions {
    int64_t memory_limit_mb;    // RLIMIT_AS, 0 = unlimited
    int cpu_seconds;            // RLIMIT_CPU, 0 = unlimited
    int max_open_files;         // RLIMIT_NOFILE
    int max_processes;          // RLIMIT_NPROC
    std::vector<std::string> readonly_paths;
    
    ConfinementOptions()
        : memory_limit_mb(512)
        , cpu_seconds(31)
        , max_open_files(64)
        , max_processes(0) {}
};

struct ConfinementReport {
    bool limits_applied;
    bool no_new_privs;
    bool network_isolated;
    bool filesystem_restricted;
    
    ConfinementReport()
        : limits_applied(false)
        , no_new_privs(false)
        , network_isolated(false)
        , filesystem_restricted(false) {}
};

class Confinement {
public:
    explicit Confinement(const ConfinementOptions& options);
    
    // Whether Landlock is supported on this kernel
    bool landlock_supported() const { return landlock_supported_; }
    
    // Add a read-only path to the Landlock ruleset (before restrict_filesystem)
    void allow_path(const std::string& path);
    
    // Resource limits, no_new_privs, parent-death signal. Must run first.
    // Returns false if a mandatory step failed.
    bool restrict_process();
    
    // Unshare user + network namespaces. Best effort.
    bool isolate_network();
    
    // Apply the Landlock ruleset. Called after the interpreter has loaded
    // what it needs, since nothing outside readonly_paths is reachable
    // afterwards. Best effort when Landlock is missing.
    bool restrict_filesystem();
    
    const ConfinementReport& report() const { return report_; }
    
    // The system library directories granted by default
    static std::vector<std::string> default_readonly_paths();
    
private:
    bool apply_limit(int resource, uint64_t value, const char* name);
    
    ConfinementOptions options_;
    ConfinementReport report_;
    bool landlock_supported_;
};

} // namespace scriptdeck

#endif // scriptdeck_SANDBOX_CONFINEMENT_HPP
