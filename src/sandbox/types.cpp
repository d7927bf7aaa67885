/*
 * scriptdeck C++ - Sandbox data model (JSON mapping)
 */
#include <scriptdeck/sandbox/types.hpp>

namespace scriptdeck {

const char* const ENTRY_POINT_NAME = "main";
const char* const TIMEOUT_MESSAGE = "Timeout exceeded";
const char* const NO_RESULT_MESSAGE = "Execution failed without producing a result";
const char* const OUTPUT_TRUNCATED_MARKER = "\n... [output truncated] ...\n";

const char* outcome_name(ExecutionOutcome outcome) {
    switch (outcome) {
        case ExecutionOutcome::COMPLETED: return "completed";
        case ExecutionOutcome::TIMED_OUT: return "timed_out";
        case ExecutionOutcome::CRASHED_WITHOUT_RESULT: return "crashed_without_result";
        case ExecutionOutcome::SPAWN_FAILED: return "spawn_failed";
        default: return "unknown";
    }
}

Json ExecutionResult::to_json() const {
    Json j;
    j["success"] = succeeded;
    j["stdout"] = stdout_text;
    j["stderr"] = stderr_text;
    j["result"] = has_return_value ? return_value : Json(nullptr);
    j["error"] = succeeded ? Json(nullptr) : Json(error_message);
    j["execution_time"] = elapsed_seconds;
    j["outcome"] = outcome_name(outcome);
    return j;
}

// ============================================================================
// WorkerRequest
// ============================================================================

Json WorkerRequest::to_json() const {
    Json j;
    j["source"] = source_text;
    j["stdin"] = stdin_text;
    j["entry_point"] = entry_point;
    
    Json lim;
    lim["max_output_bytes"] = limits.max_output_bytes;
    lim["memory_limit_mb"] = limits.memory_limit_mb;
    lim["max_open_files"] = limits.max_open_files;
    lim["cpu_seconds"] = limits.cpu_seconds;
    j["limits"] = lim;
    return j;
}

bool WorkerRequest::from_json(const Json& j, WorkerRequest& out, std::string& error) {
    if (!j.is_object()) {
        error = "request must be a JSON object";
        return false;
    }
    if (!j.contains("source") || !j["source"].is_string()) {
        error = "request is missing 'source'";
        return false;
    }
    
    try {
        out.source_text = j["source"].get<std::string>();
        out.stdin_text = j.value("stdin", std::string());
        out.entry_point = j.value("entry_point", std::string(ENTRY_POINT_NAME));
        
        if (j.contains("limits") && j["limits"].is_object()) {
            const Json& lim = j["limits"];
            out.limits.max_output_bytes = lim.value("max_output_bytes", out.limits.max_output_bytes);
            out.limits.memory_limit_mb = lim.value("memory_limit_mb", out.limits.memory_limit_mb);
            out.limits.max_open_files = lim.value("max_open_files", out.limits.max_open_files);
            out.limits.cpu_seconds = lim.value("cpu_seconds", out.limits.cpu_seconds);
        }
    } catch (const Json::type_error& e) {
        error = std::string("malformed request: ") + e.what();
        return false;
    }
    return true;
}

// ============================================================================
// WorkerReport
// ============================================================================

Json WorkerReport::to_json() const {
    Json j;
    j["success"] = success;
    j["error"] = error;
    j["has_return_value"] = has_return_value;
    j["return_value"] = return_value;
    return j;
}

bool WorkerReport::from_json(const Json& j, WorkerReport& out, std::string& error) {
    if (!j.is_object() || !j.contains("success") || !j["success"].is_boolean()) {
        error = "report is missing 'success'";
        return false;
    }
    
    try {
        out.success = j["success"].get<bool>();
        out.error = j.value("error", std::string());
        out.has_return_value = j.value("has_return_value", false);
        out.return_value = j.contains("return_value") ? j["return_value"] : Json(nullptr);
    } catch (const Json::type_error& e) {
        error = std::string("malformed report: ") + e.what();
        return false;
    }
    
    if (!out.success && out.error.empty()) {
        out.error = "Unknown error";
    }
    return true;
}

} // namespace scriptdeck
