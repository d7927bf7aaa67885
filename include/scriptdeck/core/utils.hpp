#ifndef scriptdeck_CORE_UTILS_HPP
#define scriptdeck_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace scriptdeck {

// ============ Math utilities ============

// Clamp a value between min and max
template<typename T>
T clamp(T value, T min_val, T max_val) {
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return value;
}

// ============ Time utilities ============

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp(int64_t timestamp);

// ============ String utilities ============

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Truncate string safely (UTF-8 aware, doesn't break multi-byte chars)
std::string truncate_safe(const std::string& s, size_t max_len);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Create a directory and its parents (mode 0700). True if it exists afterwards.
bool ensure_directory(const std::string& path);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

// Recursively delete a file or directory tree
bool remove_tree(const std::string& path);

bool file_exists(const std::string& path);
bool is_directory(const std::string& path);

// Read a whole file. Returns false if it cannot be opened.
bool read_file(const std::string& path, std::string& out);

// Write a whole file through a temporary sibling + rename
bool write_file_atomic(const std::string& path, const std::string& content);

// $HOME, or /tmp when unset
std::string home_dir();

// Replace a leading "~" or "~/" with home_dir()
std::string expand_home(const std::string& path);

// Directory containing the running executable (from /proc/self/exe)
std::string executable_dir();

// ============ Hashing / ID utilities ============

// Hex-encoded SHA-256 digest
std::string sha256_hex(const std::string& data);

// Generate a random UUID v4
std::string generate_uuid();

} // namespace scriptdeck

#endif // scriptdeck_CORE_UTILS_HPP
