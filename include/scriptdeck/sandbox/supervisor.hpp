/*
 * scriptdeck C++ - Sandbox Supervisor
 *
 * Runs one ExecutionRequest in a fresh scriptdeck-worker process:
 *
 *   IDLE -> SPAWNING -> RUNNING -> COMPLETED
 *                               -> TIMED_OUT
 *                               -> CRASHED_WITHOUT_RESULT
 *           SPAWNING -> SPAWN_FAILED
 *
 * The worker leads its own process group; when the run ends, for whatever
 * reason, the whole group is killed before the worker is reaped. execute()
 * never throws and always returns within timeout + grace.
 */
#ifndef scriptdeck_SANDBOX_SUPERVISOR_HPP
#define scriptdeck_SANDBOX_SUPERVISOR_HPP

#include <scriptdeck/sandbox/types.hpp>
#include <scriptdeck/core/config.hpp>
#include <string>

namespace scriptdeck {

enum class SupervisorState {
    IDLE,
    SPAWNING,
    RUNNING,
    COMPLETED,
    TIMED_OUT,
    CRASHED_WITHOUT_RESULT,
    SPAWN_FAILED
};

const char* state_name(SupervisorState state);

struct SupervisorConfig {
    std::string worker_path;
    std::string worker_log_level;
    int default_timeout_seconds;
    int max_timeout_seconds;
    int grace_ms;
    WorkerLimits limits;
    
    SupervisorConfig()
        : worker_log_level("warn")
        , default_timeout_seconds(30)
        , max_timeout_seconds(300)
        , grace_ms(2000) {}
    
    // sandbox.* keys; worker_path defaults to scriptdeck-worker beside
    // the running executable
    static SupervisorConfig from_config(const Config& cfg);
};

class SandboxSupervisor {
public:
    explicit SandboxSupervisor(const SupervisorConfig& config);
    
    // Safe to call from several threads at once; every call owns its
    // own worker process and pipes.
    ExecutionResult execute(const ExecutionRequest& request) const;
    ExecutionResult execute(const std::string& source,
                            const std::string& stdin_text,
                            int timeout_seconds) const;
    
    // Non-positive -> default, above the maximum -> maximum
    int effective_timeout(int requested_seconds) const;
    
    const SupervisorConfig& config() const { return config_; }
    
private:
    SupervisorConfig config_;
};

} // namespace scriptdeck

#endif // scriptdeck_SANDBOX_SUPERVISOR_HPP
