/*
 * scriptdeck C++ - Script Store
 *
 * Persistence for saved scripts:
 *   collections table  - one row per collection, creation order preserved
 *   scripts table      - metadata keyed by (collection, filename)
 *   <base_dir>/<collection>/<filename>  - the script bodies
 *
 * The default collection always exists and cannot be deleted. Errors are
 * reported as false / empty results plus last_error(); nothing throws.
 */
#ifndef scriptdeck_STORAGE_SCRIPT_STORE_HPP
#define scriptdeck_STORAGE_SCRIPT_STORE_HPP

#include <scriptdeck/core/json.hpp>
#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include <sqlite3.h>

namespace scriptdeck {

struct ScriptMetadata {
    std::string name;           // display name as given by the user
    std::string collection;
    std::string filename;       // sanitized name + ".py"
    std::string description;
    std::vector<std::string> tags;
    int64_t created_at;         // unix ms
    int64_t modified_at;        // unix ms
    std::string content_hash;   // SHA-256 of the body
    
    ScriptMetadata() : created_at(0), modified_at(0) {}
    
    Json to_json() const;
};

class ScriptStore {
public:
    static const char* const DEFAULT_COLLECTION;
    
    ScriptStore();
    ~ScriptStore();
    
    // Open (or create) the database and the body directory, and make sure
    // the default collection exists
    bool open(const std::string& db_path, const std::string& base_dir);
    void close();
    bool is_open() const { return db_ != nullptr; }
    
    // Non-empty, letters/digits/space/'-'/'_', not starting with a space
    static bool is_valid_collection_name(const std::string& name);
    
    // ============ Collections ============
    
    bool create_collection(const std::string& name);
    bool delete_collection(const std::string& name);
    bool has_collection(const std::string& name);
    std::vector<std::string> list_collections();
    
    // ============ Metadata ============
    
    std::vector<ScriptMetadata> list_scripts(const std::string& collection);
    std::vector<ScriptMetadata> list_all_scripts();
    bool get_script(const std::string& collection, const std::string& filename, ScriptMetadata& out);
    
    // Insert or update by (collection, filename). created_at of an existing
    // row is kept.
    bool upsert_script(const ScriptMetadata& meta);
    // Removing a missing row is not an error
    bool remove_script(const std::string& collection, const std::string& filename);
    
    // ============ Bodies ============
    
    std::string body_path(const std::string& collection, const std::string& filename) const;
    bool write_body(const std::string& collection, const std::string& filename, const std::string& content);
    
    // False if the body does not exist or cannot be read
    bool read_body(const std::string& collection, const std::string& filename, std::string& out);
    bool delete_body(const std::string& collection, const std::string& filename);
    
    const std::string& base_dir() const { return base_dir_; }
    std::string last_error() const;
    
private:
    ScriptStore(const ScriptStore&);
    ScriptStore& operator=(const ScriptStore&);
    
    bool init_tables();
    bool exec_sql(const std::string& sql);
    bool insert_collection(const std::string& name);
    bool is_safe_filename(const std::string& filename) const;
    std::vector<ScriptMetadata> query_scripts(const char* sql, const std::string& collection);
    void set_error(const std::string& error);
    void set_error_from_db(const char* what);
    
    sqlite3* db_;
    std::string base_dir_;
    std::string last_error_;
    mutable std::mutex error_mutex_;
};

} // namespace scriptdeck

#endif // scriptdeck_STORAGE_SCRIPT_STORE_HPP
