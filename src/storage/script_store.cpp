/*
 * scriptdeck C++ - Script Store Implementation
 *
 * The connection is opened in serialized threading mode, so callers on
 * different threads may share it. Read-modify-write sequences spanning
 * several calls are the caller's to serialize.
 */
#include <scriptdeck/storage/script_store.hpp>
#include <scriptdeck/core/logger.hpp>
#include <scriptdeck/core/utils.hpp>

#include <cctype>
#include <cstring>
#include <cerrno>
#include <unistd.h>

namespace scriptdeck {

const char* const ScriptStore::DEFAULT_COLLECTION = "Uncategorized";

// ============================================================================
// Helpers
// ============================================================================

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string();
}

std::string tags_to_text(const std::vector<std::string>& tags) {
    Json arr = Json::array();
    for (size_t i = 0; i < tags.size(); ++i) {
        arr.push_back(tags[i]);
    }
    return arr.dump(-1, ' ', false, Json::error_handler_t::replace);
}

std::vector<std::string> tags_from_text(const std::string& text) {
    std::vector<std::string> tags;
    Json arr = Json::parse(text, nullptr, false);
    if (arr.is_discarded() || !arr.is_array()) return tags;
    
    for (size_t i = 0; i < arr.size(); ++i) {
        if (arr[i].is_string()) tags.push_back(arr[i].get<std::string>());
    }
    return tags;
}

// Column order shared by every script query
const char* const SCRIPT_COLUMNS =
    "name, collection, filename, description, tags, created_at, modified_at, content_hash";

ScriptMetadata read_script_row(sqlite3_stmt* stmt) {
    ScriptMetadata meta;
    meta.name = column_text(stmt, 0);
    meta.collection = column_text(stmt, 1);
    meta.filename = column_text(stmt, 2);
    meta.description = column_text(stmt, 3);
    meta.tags = tags_from_text(column_text(stmt, 4));
    meta.created_at = sqlite3_column_int64(stmt, 5);
    meta.modified_at = sqlite3_column_int64(stmt, 6);
    meta.content_hash = column_text(stmt, 7);
    return meta;
}

} // anonymous namespace

Json ScriptMetadata::to_json() const {
    Json j;
    j["name"] = name;
    j["collection"] = collection;
    j["filename"] = filename;
    j["description"] = description;
    j["tags"] = tags;
    j["created"] = format_timestamp(created_at / 1000);
    j["modified"] = format_timestamp(modified_at / 1000);
    j["content_hash"] = content_hash;
    return j;
}

// ============================================================================
// ScriptStore Implementation
// ============================================================================

ScriptStore::ScriptStore() : db_(nullptr) {}

ScriptStore::~ScriptStore() {
    close();
}

bool ScriptStore::open(const std::string& db_path, const std::string& base_dir) {
    if (db_) {
        close();
    }
    
    if (!ensure_directory(base_dir)) {
        set_error("Failed to create script directory '" + base_dir + "': " + strerror(errno));
        LOG_ERROR("[ScriptStore] %s", last_error().c_str());
        return false;
    }
    base_dir_ = base_dir;
    
    // Ensure parent directory exists
    if (!create_parent_directory(db_path)) {
        set_error("Failed to create parent directory for '" + db_path + "'");
        LOG_ERROR("[ScriptStore] %s", last_error().c_str());
        return false;
    }
    
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(db_path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        set_error(std::string("Failed to open database '") + db_path + "': " +
                  (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc)));
        LOG_ERROR("[ScriptStore] %s", last_error().c_str());
        if (db_) sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    
    // WAL for concurrent readers, busy timeout for concurrent writers
    sqlite3_busy_timeout(db_, 5000);
    if (!exec_sql("PRAGMA journal_mode=WAL")) {
        LOG_WARN("[ScriptStore] WAL mode unavailable, using the default journal");
    }
    exec_sql("PRAGMA synchronous=NORMAL");
    
    if (!init_tables()) {
        LOG_ERROR("[ScriptStore] Failed to initialize tables");
        close();
        return false;
    }
    
    if (!has_collection(DEFAULT_COLLECTION) && !create_collection(DEFAULT_COLLECTION)) {
        LOG_ERROR("[ScriptStore] Failed to create default collection: %s", last_error().c_str());
        close();
        return false;
    }
    
    LOG_INFO("[ScriptStore] Database opened: %s (scripts in %s)", db_path.c_str(), base_dir_.c_str());
    return true;
}

void ScriptStore::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::string ScriptStore::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return last_error_;
}

void ScriptStore::set_error(const std::string& error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    last_error_ = error;
}

void ScriptStore::set_error_from_db(const char* what) {
    set_error(std::string(what) + ": " + (db_ ? sqlite3_errmsg(db_) : "database not open"));
    LOG_ERROR("[ScriptStore] %s", last_error().c_str());
}

bool ScriptStore::exec_sql(const std::string& sql) {
    if (!db_) return false;
    
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    
    if (rc != SQLITE_OK) {
        set_error(std::string("SQL error: ") + (err_msg ? err_msg : "unknown"));
        LOG_ERROR("[ScriptStore] SQL error: %s\n  Query: %s",
                  err_msg ? err_msg : "unknown", sql.c_str());
        if (err_msg) sqlite3_free(err_msg);
        return false;
    }
    
    return true;
}

bool ScriptStore::init_tables() {
    bool ok = exec_sql(
        "CREATE TABLE IF NOT EXISTS collections ("
        "  name TEXT PRIMARY KEY,"
        "  created_at INTEGER NOT NULL"
        ")"
    );
    if (!ok) return false;
    
    ok = exec_sql(
        "CREATE TABLE IF NOT EXISTS scripts ("
        "  collection TEXT NOT NULL,"
        "  filename TEXT NOT NULL,"
        "  name TEXT NOT NULL,"
        "  description TEXT DEFAULT '',"
        "  tags TEXT DEFAULT '[]',"
        "  created_at INTEGER NOT NULL,"
        "  modified_at INTEGER NOT NULL,"
        "  content_hash TEXT DEFAULT '',"
        "  PRIMARY KEY (collection, filename)"
        ")"
    );
    if (!ok) return false;
    
    exec_sql("CREATE INDEX IF NOT EXISTS idx_scripts_collection ON scripts(collection)");
    
    LOG_DEBUG("[ScriptStore] Tables initialized");
    return true;
}

bool ScriptStore::is_valid_collection_name(const std::string& name) {
    if (name.empty() || name[0] == ' ') return false;
    
    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        if (!std::isalnum(c) && c != ' ' && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

bool ScriptStore::is_safe_filename(const std::string& filename) const {
    return !filename.empty() && filename[0] != '.' &&
           filename.find('/') == std::string::npos &&
           filename.find('\0') == std::string::npos;
}

// ============================================================================
// Collections
// ============================================================================

bool ScriptStore::insert_collection(const std::string& name) {
    const char* sql = "INSERT INTO collections (name, created_at) VALUES (?, ?)";
    
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        set_error_from_db("create_collection prepare failed");
        return false;
    }
    
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 2, current_timestamp_ms());
    
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (rc != SQLITE_DONE) {
        set_error_from_db("create_collection step failed");
        return false;
    }
    return true;
}

bool ScriptStore::create_collection(const std::string& name) {
    if (!db_) {
        set_error("Store not open");
        return false;
    }
    if (!is_valid_collection_name(name)) {
        set_error("Invalid collection name '" + name + "'");
        return false;
    }
    if (has_collection(name)) {
        set_error("Collection '" + name + "' already exists");
        return false;
    }
    
    std::string dir = join_path(base_dir_, name);
    if (!ensure_directory(dir)) {
        set_error("Failed to create directory '" + dir + "': " + strerror(errno));
        LOG_ERROR("[ScriptStore] %s", last_error().c_str());
        return false;
    }
    
    if (!insert_collection(name)) return false;
    
    LOG_DEBUG("[ScriptStore] Created collection '%s'", name.c_str());
    return true;
}

bool ScriptStore::delete_collection(const std::string& name) {
    if (!db_) {
        set_error("Store not open");
        return false;
    }
    if (name == DEFAULT_COLLECTION) {
        set_error("The default collection cannot be deleted");
        return false;
    }
    if (!is_valid_collection_name(name) || !has_collection(name)) {
        set_error("Collection '" + name + "' not found");
        return false;
    }
    
    // Scripts first: a failure in between leaves an empty collection, never
    // orphaned metadata
    const char* statements[] = {
        "DELETE FROM scripts WHERE collection = ?",
        "DELETE FROM collections WHERE name = ?",
        nullptr
    };
    for (int i = 0; statements[i] != nullptr; ++i) {
        sqlite3_stmt* stmt = nullptr;
        if (sqlite3_prepare_v2(db_, statements[i], -1, &stmt, nullptr) != SQLITE_OK) {
            set_error_from_db("delete_collection prepare failed");
            return false;
        }
        sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
        int rc = sqlite3_step(stmt);
        sqlite3_finalize(stmt);
        if (rc != SQLITE_DONE) {
            set_error_from_db("delete_collection step failed");
            return false;
        }
    }
    
    std::string dir = join_path(base_dir_, name);
    if (!remove_tree(dir)) {
        set_error("Failed to remove directory '" + dir + "': " + strerror(errno));
        LOG_WARN("[ScriptStore] %s", last_error().c_str());
        return false;
    }
    
    LOG_DEBUG("[ScriptStore] Deleted collection '%s'", name.c_str());
    return true;
}

bool ScriptStore::has_collection(const std::string& name) {
    if (!db_) return false;
    
    const char* sql = "SELECT 1 FROM collections WHERE name = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("has_collection prepare failed");
        return false;
    }
    
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    bool found = sqlite3_step(stmt) == SQLITE_ROW;
    sqlite3_finalize(stmt);
    return found;
}

std::vector<std::string> ScriptStore::list_collections() {
    std::vector<std::string> names;
    if (!db_) return names;
    
    const char* sql = "SELECT name FROM collections ORDER BY created_at, rowid";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("list_collections prepare failed");
        return names;
    }
    
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        names.push_back(column_text(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return names;
}

// ============================================================================
// Metadata
// ============================================================================

std::vector<ScriptMetadata> ScriptStore::query_scripts(const char* sql, const std::string& collection) {
    std::vector<ScriptMetadata> results;
    if (!db_) return results;
    
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("list_scripts prepare failed");
        return results;
    }
    
    if (!collection.empty()) {
        sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
    }
    
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        results.push_back(read_script_row(stmt));
    }
    sqlite3_finalize(stmt);
    return results;
}

std::vector<ScriptMetadata> ScriptStore::list_scripts(const std::string& collection) {
    std::string sql = std::string("SELECT ") + SCRIPT_COLUMNS +
                      " FROM scripts WHERE collection = ? ORDER BY created_at, rowid";
    return query_scripts(sql.c_str(), collection);
}

std::vector<ScriptMetadata> ScriptStore::list_all_scripts() {
    std::string sql = std::string("SELECT s.name, s.collection, s.filename, s.description, s.tags, "
                                  "s.created_at, s.modified_at, s.content_hash "
                                  "FROM scripts s LEFT JOIN collections c ON c.name = s.collection "
                                  "ORDER BY c.created_at, c.rowid, s.created_at, s.rowid");
    return query_scripts(sql.c_str(), "");
}

bool ScriptStore::get_script(const std::string& collection, const std::string& filename,
                             ScriptMetadata& out) {
    if (!db_) return false;
    
    std::string sql = std::string("SELECT ") + SCRIPT_COLUMNS +
                      " FROM scripts WHERE collection = ? AND filename = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("get_script prepare failed");
        return false;
    }
    
    sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, filename.c_str(), -1, SQLITE_TRANSIENT);
    
    bool found = false;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        out = read_script_row(stmt);
        found = true;
    }
    sqlite3_finalize(stmt);
    return found;
}

bool ScriptStore::upsert_script(const ScriptMetadata& meta) {
    if (!db_) return false;
    
    int64_t now = current_timestamp_ms();
    int64_t created = meta.created_at > 0 ? meta.created_at : now;
    int64_t modified = meta.modified_at > 0 ? meta.modified_at : now;
    
    const char* sql =
        "INSERT INTO scripts "
        "(collection, filename, name, description, tags, created_at, modified_at, content_hash) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT(collection, filename) DO UPDATE SET "
        "  name = excluded.name,"
        "  description = excluded.description,"
        "  tags = excluded.tags,"
        "  modified_at = excluded.modified_at,"
        "  content_hash = excluded.content_hash";
    
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        set_error_from_db("upsert_script prepare failed");
        return false;
    }
    
    std::string tags = tags_to_text(meta.tags);
    sqlite3_bind_text(stmt, 1, meta.collection.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, meta.filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, meta.name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, meta.description.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, tags.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 6, created);
    sqlite3_bind_int64(stmt, 7, modified);
    sqlite3_bind_text(stmt, 8, meta.content_hash.c_str(), -1, SQLITE_TRANSIENT);
    
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (rc != SQLITE_DONE) {
        set_error_from_db("upsert_script step failed");
        return false;
    }
    
    LOG_DEBUG("[ScriptStore] Saved metadata %s/%s", meta.collection.c_str(), meta.filename.c_str());
    return true;
}

bool ScriptStore::remove_script(const std::string& collection, const std::string& filename) {
    if (!db_) return false;
    
    const char* sql = "DELETE FROM scripts WHERE collection = ? AND filename = ?";
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        set_error_from_db("remove_script prepare failed");
        return false;
    }
    
    sqlite3_bind_text(stmt, 1, collection.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, filename.c_str(), -1, SQLITE_TRANSIENT);
    
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    
    if (rc != SQLITE_DONE) {
        set_error_from_db("remove_script step failed");
        return false;
    }
    return true;
}

// ============================================================================
// Bodies
// ============================================================================

std::string ScriptStore::body_path(const std::string& collection, const std::string& filename) const {
    return join_path(join_path(base_dir_, collection), filename);
}

bool ScriptStore::write_body(const std::string& collection, const std::string& filename,
                             const std::string& content) {
    if (!is_valid_collection_name(collection) || !is_safe_filename(filename)) {
        set_error("Refusing to write outside the collection directory: " + collection + "/" + filename);
        LOG_ERROR("[ScriptStore] %s", last_error().c_str());
        return false;
    }
    
    std::string dir = join_path(base_dir_, collection);
    if (!ensure_directory(dir)) {
        set_error("Failed to create directory '" + dir + "': " + strerror(errno));
        LOG_ERROR("[ScriptStore] %s", last_error().c_str());
        return false;
    }
    
    std::string path = body_path(collection, filename);
    if (!write_file_atomic(path, content)) {
        set_error("Failed to write '" + path + "': " + strerror(errno));
        LOG_ERROR("[ScriptStore] %s", last_error().c_str());
        return false;
    }
    return true;
}

bool ScriptStore::read_body(const std::string& collection, const std::string& filename,
                            std::string& out) {
    if (!is_valid_collection_name(collection) || !is_safe_filename(filename)) {
        set_error("Invalid script location: " + collection + "/" + filename);
        return false;
    }
    
    std::string path = body_path(collection, filename);
    if (!file_exists(path)) {
        set_error("Script body not found: " + path);
        return false;
    }
    if (!read_file(path, out)) {
        set_error("Failed to read '" + path + "': " + strerror(errno));
        LOG_ERROR("[ScriptStore] %s", last_error().c_str());
        return false;
    }
    return true;
}

bool ScriptStore::delete_body(const std::string& collection, const std::string& filename) {
    if (!is_valid_collection_name(collection) || !is_safe_filename(filename)) {
        set_error("Invalid script location: " + collection + "/" + filename);
        return false;
    }
    
    std::string path = body_path(collection, filename);
    if (unlink(path.c_str()) != 0) {
        if (errno == ENOENT) return true;
        set_error("Failed to delete '" + path + "': " + strerror(errno));
        LOG_ERROR("[ScriptStore] %s", last_error().c_str());
        return false;
    }
    return true;
}

} // namespace scriptdeck
