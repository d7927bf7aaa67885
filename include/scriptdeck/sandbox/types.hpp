/*
 * scriptdeck C++ - Sandbox data model
 *
 * ExecutionRequest / ExecutionResult are what callers see.
 * WorkerRequest / WorkerReport are the records exchanged with the
 * scriptdeck-worker process (request on its stdin, report as the final
 * RESULT frame of the channel).
 */
#ifndef scriptdeck_SANDBOX_TYPES_HPP
#define scriptdeck_SANDBOX_TYPES_HPP

#include <scriptdeck/core/json.hpp>
#include <string>
#include <cstdint>
#include <cstddef>

namespace scriptdeck {

// Name of the zero-argument callable invoked after top-level evaluation
extern const char* const ENTRY_POINT_NAME;

extern const char* const TIMEOUT_MESSAGE;
extern const char* const NO_RESULT_MESSAGE;
extern const char* const OUTPUT_TRUNCATED_MARKER;

// Terminal state that produced an ExecutionResult
enum class ExecutionOutcome {
    COMPLETED,
    TIMED_OUT,
    CRASHED_WITHOUT_RESULT,
    SPAWN_FAILED
};

const char* outcome_name(ExecutionOutcome outcome);

struct ExecutionRequest {
    std::string source_text;
    std::string stdin_text;
    int timeout_seconds;        // > 0; non-positive means "use the configured default"
    
    ExecutionRequest() : timeout_seconds(30) {}
    ExecutionRequest(const std::string& source, const std::string& input, int timeout = 30)
        : source_text(source), stdin_text(input), timeout_seconds(timeout) {}
};

struct ExecutionResult {
    bool succeeded;
    std::string stdout_text;
    std::string stderr_text;
    bool has_return_value;      // true only on success when the entry point ran
    Json return_value;
    std::string error_message;  // empty iff succeeded
    double elapsed_seconds;
    ExecutionOutcome outcome;
    
    ExecutionResult()
        : succeeded(false)
        , has_return_value(false)
        , return_value(nullptr)
        , elapsed_seconds(0.0)
        , outcome(ExecutionOutcome::COMPLETED) {}
    
    static ExecutionResult failure(ExecutionOutcome outcome, const std::string& message) {
        ExecutionResult r;
        r.succeeded = false;
        r.outcome = outcome;
        r.error_message = message;
        return r;
    }
    
    Json to_json() const;
};

// Limits forwarded to the worker. Fixed by the supervisor's configuration,
// never by the request.
struct WorkerLimits {
    size_t max_output_bytes;
    int64_t memory_limit_mb;
    int max_open_files;
    int cpu_seconds;
    
    WorkerLimits()
        : max_output_bytes(1000000)
        , memory_limit_mb(512)
        , max_open_files(64)
        , cpu_seconds(31) {}
};

struct WorkerRequest {
    std::string source_text;
    std::string stdin_text;
    std::string entry_point;
    WorkerLimits limits;
    
    WorkerRequest() : entry_point(ENTRY_POINT_NAME) {}
    
    Json to_json() const;
    static bool from_json(const Json& j, WorkerRequest& out, std::string& error);
};

// Terminal record written by the worker as the RESULT frame
struct WorkerReport {
    bool success;
    std::string error;
    bool has_return_value;
    Json return_value;
    
    WorkerReport() : success(false), has_return_value(false), return_value(nullptr) {}
    
    Json to_json() const;
    static bool from_json(const Json& j, WorkerReport& out, std::string& error);
};

} // namespace scriptdeck

#endif // scriptdeck_SANDBOX_TYPES_HPP
