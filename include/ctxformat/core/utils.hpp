#ifndef ctxformat_CORE_UTILS_HPP
#define ctxformat_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <ctime>

namespace ctxformat {

// ============ Time utilities ============

// Get current Unix timestamp in seconds
int64_t current_timestamp();

// Get current Unix timestamp in milliseconds
int64_t current_timestamp_ms();

// Format timestamp as ISO 8601 string (YYYY-MM-DDTHH:MM:SSZ)
std::string format_timestamp(int64_t timestamp);

// Current UTC time as ISO 8601
std::string now_iso8601();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Trim whitespace from left side
std::string ltrim(const std::string& s);

// Trim whitespace from right side
std::string rtrim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Check if string starts with prefix
bool starts_with(const std::string& s, const std::string& prefix);

// Join strings with delimiter
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);

// Strict decimal parsing; the whole string must be consumed
bool parse_int64(const std::string& s, int64_t& out);
bool parse_double(const std::string& s, double& out);

// Shortest of "%.15g", "%.16g" and "%.17g" that reads back as the same
// double; used for numeric fields
std::string format_double(double value);

// True if `s` is well-formed UTF-8 (no overlongs, no surrogates).
// On failure, `bad_offset` receives the byte offset of the first bad sequence.
bool is_valid_utf8(const std::string& s, size_t* bad_offset = nullptr);

// ============ Path utilities ============

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Create a directory and its parents
bool create_directories(const std::string& dir);

// Create parent directory for a file path (recursive)
bool create_parent_directory(const std::string& filepath);

bool file_exists(const std::string& path);

// Size of a regular file in bytes, or -1 if it cannot be stat'ed
int64_t file_size(const std::string& path);

// Read a whole file. Returns false and sets `error` on failure.
bool read_file(const std::string& path, std::string& out, std::string& error);

// ============ UUID utilities ============

// Generate a random UUID v4
std::string generate_uuid();

// ============ Hashing utilities ============

// Lowercase hex SHA-256 digest of `data`
std::string sha256_hex(const std::string& data);

} // namespace ctxformat

#endif // ctxformat_CORE_UTILS_HPP
