/*
 * scriptdeck C++ - Script Runner Implementation
 */
#include <scriptdeck/storage/script_runner.hpp>
#include <scriptdeck/core/logger.hpp>
#include <scriptdeck/core/utils.hpp>

#include <cctype>

namespace scriptdeck {

namespace {
const char* const SCRIPT_EXTENSION = ".py";
}

const char* error_kind_name(ScriptErrorKind kind) {
    switch (kind) {
        case ScriptErrorKind::NONE: return "NONE";
        case ScriptErrorKind::NAME_REJECTED: return "NAME_REJECTED";
        case ScriptErrorKind::INVALID_COLLECTION_NAME: return "INVALID_COLLECTION_NAME";
        case ScriptErrorKind::COLLECTION_NOT_FOUND: return "COLLECTION_NOT_FOUND";
        case ScriptErrorKind::COLLECTION_EXISTS: return "COLLECTION_EXISTS";
        case ScriptErrorKind::PROTECTED_COLLECTION: return "PROTECTED_COLLECTION";
        case ScriptErrorKind::SCRIPT_NOT_FOUND: return "SCRIPT_NOT_FOUND";
        case ScriptErrorKind::STORAGE_FAILED: return "STORAGE_FAILED";
    }
    return "UNKNOWN";
}

ScriptRunner::ScriptRunner(ScriptStore& store, const SandboxSupervisor& supervisor)
    : store_(store)
    , supervisor_(supervisor) {}

std::string ScriptRunner::sanitize_name(const std::string& name) {
    std::string clean;
    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        if (std::isalnum(c) || c == '-' || c == '_') {
            clean += static_cast<char>(c);
        }
    }
    return clean;
}

std::shared_ptr<std::mutex> ScriptRunner::collection_lock(const std::string& collection) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    std::shared_ptr<std::mutex>& lock = locks_[collection];
    if (!lock) {
        lock = std::make_shared<std::mutex>();
    }
    return lock;
}

// Threads already holding the old mutex keep it alive through their shared_ptr
void ScriptRunner::release_collection_lock(const std::string& collection) {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    locks_.erase(collection);
}

size_t ScriptRunner::lock_count() {
    std::lock_guard<std::mutex> guard(locks_mutex_);
    return locks_.size();
}

ScriptOpResult ScriptRunner::check_collection(const std::string& collection) {
    if (!ScriptStore::is_valid_collection_name(collection)) {
        return ScriptOpResult::fail(ScriptErrorKind::INVALID_COLLECTION_NAME,
                                    "Invalid collection name '" + collection + "'");
    }
    if (!store_.has_collection(collection)) {
        return ScriptOpResult::fail(ScriptErrorKind::COLLECTION_NOT_FOUND,
                                    "Collection '" + collection + "' does not exist");
    }
    return ScriptOpResult::ok();
}

// ============================================================================
// Execution
// ============================================================================

ExecutionResult ScriptRunner::execute(const std::string& source,
                                      const std::string& stdin_text,
                                      int timeout_seconds) const {
    return supervisor_.execute(ExecutionRequest(source, stdin_text, timeout_seconds));
}

ExecutionResult ScriptRunner::execute_saved(const std::string& name,
                                            const std::string& collection,
                                            const std::string& stdin_text,
                                            int timeout_seconds) {
    LoadedScript script;
    ScriptOpResult loaded = load(name, collection, script);
    if (!loaded.success) {
        LOG_WARN("[ScriptRunner] Cannot run %s/%s: %s",
                 collection.c_str(), name.c_str(), loaded.error.c_str());
        return ExecutionResult::failure(ExecutionOutcome::SPAWN_FAILED,
                                        loaded.error_kind == ScriptErrorKind::SCRIPT_NOT_FOUND
                                            ? "Script not found" : loaded.error);
    }
    
    LOG_DEBUG("[ScriptRunner] Running saved script %s/%s",
              collection.c_str(), script.metadata.filename.c_str());
    return execute(script.code, stdin_text, timeout_seconds);
}

// ============================================================================
// Scripts
// ============================================================================

ScriptOpResult ScriptRunner::save(const std::string& name,
                                  const std::string& code,
                                  const std::string& collection,
                                  const std::string& description,
                                  const std::vector<std::string>& tags) {
    std::string clean = sanitize_name(name);
    if (clean.empty()) {
        return ScriptOpResult::fail(ScriptErrorKind::NAME_REJECTED,
                                    "Script name '" + name + "' has no usable characters");
    }
    
    ScriptOpResult check = check_collection(collection);
    if (!check.success) return check;
    
    std::shared_ptr<std::mutex> lock = collection_lock(collection);
    std::lock_guard<std::mutex> guard(*lock);
    
    // Deleted while we waited
    check = check_collection(collection);
    if (!check.success) return check;
    
    std::string filename = clean + SCRIPT_EXTENSION;
    int64_t now = current_timestamp_ms();
    
    ScriptMetadata meta;
    ScriptMetadata existing;
    bool updating = store_.get_script(collection, filename, existing);
    
    meta.name = name;
    meta.collection = collection;
    meta.filename = filename;
    meta.description = description;
    meta.tags = tags;
    meta.created_at = updating ? existing.created_at : now;
    meta.modified_at = now;
    meta.content_hash = sha256_hex(code);
    
    if (!store_.write_body(collection, filename, code)) {
        return ScriptOpResult::fail(ScriptErrorKind::STORAGE_FAILED, store_.last_error());
    }
    if (!store_.upsert_script(meta)) {
        return ScriptOpResult::fail(ScriptErrorKind::STORAGE_FAILED, store_.last_error());
    }
    
    LOG_INFO("[ScriptRunner] %s script '%s' in %s",
             updating ? "Updated" : "Saved", name.c_str(), collection.c_str());
    return ScriptOpResult::ok();
}

ScriptOpResult ScriptRunner::load(const std::string& name, const std::string& collection,
                                  LoadedScript& out) {
    std::string clean = sanitize_name(name);
    if (clean.empty()) {
        return ScriptOpResult::fail(ScriptErrorKind::NAME_REJECTED,
                                    "Script name '" + name + "' has no usable characters");
    }
    
    ScriptOpResult check = check_collection(collection);
    if (!check.success) return check;
    
    std::shared_ptr<std::mutex> lock = collection_lock(collection);
    std::lock_guard<std::mutex> guard(*lock);
    
    // Deleted while we waited
    check = check_collection(collection);
    if (!check.success) return check;
    
    std::string filename = clean + SCRIPT_EXTENSION;
    if (!store_.read_body(collection, filename, out.code)) {
        return ScriptOpResult::fail(ScriptErrorKind::SCRIPT_NOT_FOUND,
                                    "Script '" + name + "' not found in " + collection);
    }
    
    // A body without metadata still loads
    if (!store_.get_script(collection, filename, out.metadata)) {
        out.metadata = ScriptMetadata();
        out.metadata.name = name;
        out.metadata.collection = collection;
        out.metadata.filename = filename;
        out.metadata.content_hash = sha256_hex(out.code);
    }
    return ScriptOpResult::ok();
}

ScriptOpResult ScriptRunner::remove(const std::string& name, const std::string& collection) {
    std::string clean = sanitize_name(name);
    if (clean.empty()) {
        return ScriptOpResult::fail(ScriptErrorKind::NAME_REJECTED,
                                    "Script name '" + name + "' has no usable characters");
    }
    
    ScriptOpResult check = check_collection(collection);
    if (!check.success) return check;
    
    std::shared_ptr<std::mutex> lock = collection_lock(collection);
    std::lock_guard<std::mutex> guard(*lock);
    
    // Deleted while we waited
    check = check_collection(collection);
    if (!check.success) return check;
    
    std::string filename = clean + SCRIPT_EXTENSION;
    ScriptMetadata existing;
    bool has_metadata = store_.get_script(collection, filename, existing);
    bool has_body = file_exists(store_.body_path(collection, filename));
    if (!has_metadata && !has_body) {
        return ScriptOpResult::fail(ScriptErrorKind::SCRIPT_NOT_FOUND,
                                    "Script '" + name + "' not found in " + collection);
    }
    
    if (!store_.delete_body(collection, filename) ||
        !store_.remove_script(collection, filename)) {
        return ScriptOpResult::fail(ScriptErrorKind::STORAGE_FAILED, store_.last_error());
    }
    
    LOG_INFO("[ScriptRunner] Deleted script '%s' from %s", name.c_str(), collection.c_str());
    return ScriptOpResult::ok();
}

std::vector<ScriptMetadata> ScriptRunner::list(const std::string& collection) {
    if (!check_collection(collection).success) {
        return std::vector<ScriptMetadata>();
    }
    std::shared_ptr<std::mutex> lock = collection_lock(collection);
    std::lock_guard<std::mutex> guard(*lock);
    return store_.list_scripts(collection);
}

std::vector<ScriptMetadata> ScriptRunner::list_all() {
    return store_.list_all_scripts();
}

std::vector<ScriptMetadata> ScriptRunner::search(const std::string& query) {
    std::string needle = to_lower(query);
    std::vector<ScriptMetadata> all = store_.list_all_scripts();
    std::vector<ScriptMetadata> hits;
    
    for (size_t i = 0; i < all.size(); ++i) {
        bool match = to_lower(all[i].name).find(needle) != std::string::npos;
        for (size_t t = 0; !match && t < all[i].tags.size(); ++t) {
            match = to_lower(all[i].tags[t]).find(needle) != std::string::npos;
        }
        if (match) hits.push_back(all[i]);
    }
    
    LOG_DEBUG("[ScriptRunner] Search '%s' matched %zu of %zu scripts",
              query.c_str(), hits.size(), all.size());
    return hits;
}

// ============================================================================
// Collections
// ============================================================================

ScriptOpResult ScriptRunner::create_collection(const std::string& name) {
    if (!ScriptStore::is_valid_collection_name(name)) {
        return ScriptOpResult::fail(ScriptErrorKind::INVALID_COLLECTION_NAME,
                                    "Invalid collection name '" + name + "'");
    }
    
    std::shared_ptr<std::mutex> lock = collection_lock(name);
    std::lock_guard<std::mutex> guard(*lock);
    
    if (store_.has_collection(name)) {
        return ScriptOpResult::fail(ScriptErrorKind::COLLECTION_EXISTS,
                                    "Collection '" + name + "' already exists");
    }
    if (!store_.create_collection(name)) {
        return ScriptOpResult::fail(ScriptErrorKind::STORAGE_FAILED, store_.last_error());
    }
    
    LOG_INFO("[ScriptRunner] Created collection '%s'", name.c_str());
    return ScriptOpResult::ok();
}

ScriptOpResult ScriptRunner::delete_collection(const std::string& name) {
    if (name == ScriptStore::DEFAULT_COLLECTION) {
        return ScriptOpResult::fail(ScriptErrorKind::PROTECTED_COLLECTION,
                                    std::string("Collection '") + ScriptStore::DEFAULT_COLLECTION +
                                    "' cannot be deleted");
    }
    
    ScriptOpResult check = check_collection(name);
    if (!check.success) return check;
    
    std::shared_ptr<std::mutex> lock = collection_lock(name);
    {
        std::lock_guard<std::mutex> guard(*lock);
        
        check = check_collection(name);
        if (!check.success) return check;
        
        if (!store_.delete_collection(name)) {
            return ScriptOpResult::fail(ScriptErrorKind::STORAGE_FAILED, store_.last_error());
        }
    }
    release_collection_lock(name);
    
    LOG_INFO("[ScriptRunner] Deleted collection '%s'", name.c_str());
    return ScriptOpResult::ok();
}

std::vector<std::string> ScriptRunner::list_collections() {
    return store_.list_collections();
}

} // namespace scriptdeck
