#ifndef PARABOX_CORE_UTILS_HPP
#define PARABOX_CORE_UTILS_HPP

#include <string>
#include <vector>
#include <cstdint>

namespace parabox {

// ============ Time utilities ============

// Sleep for the specified number of milliseconds
void sleep_ms(int milliseconds);

// Monotonic milliseconds, for measuring elapsed time only
int64_t monotonic_ms();

// ============ String utilities ============

// Trim whitespace from both ends of a string
std::string trim(const std::string& s);

// Convert string to lowercase
std::string to_lower(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delimiter);

// Number of UTF-8 code points (continuation bytes are not counted)
size_t utf8_length(const std::string& s);

// First max_chars code points of s; never splits a multi-byte sequence
std::string utf8_truncate(const std::string& s, size_t max_chars);

// Trim, then cap at max_chars code points. Empty result means "drop it".
std::string clip_text(const std::string& text, size_t max_chars);

// True when s is non-empty and consists only of [0-9a-fA-F]
bool is_hex(const std::string& s);

// ============ Path utilities ============

// Get home directory
std::string get_home_dir();

// Resolve ~ to home directory
std::string resolve_user_path(const std::string& path);

// Join path components
std::string join_path(const std::string& a, const std::string& b);

// Get directory name from path
std::string dirname(const std::string& path);

// Check if path exists
bool path_exists(const std::string& path);

// Check if path is a regular file
bool is_regular_file(const std::string& path);

// Create directory (and parents if needed)
bool mkdir_p(const std::string& path);

// Directory holding the running executable (empty if unknown)
std::string executable_dir();

// ============ File utilities ============

// Read a whole file; false if it cannot be opened or read
bool read_file(const std::string& path, std::string& out);

// Write data to path.tmp-<pid>, fsync, then rename over path.
// Readers see either the old file or the complete new one.
bool write_file_atomic(const std::string& path, const std::string& data);

// ============ Identifiers and hashing ============

// Generate a random UUID v4
std::string generate_uuid();

// Compute SHA256 hash as lowercase hex string
std::string sha256_hex(const std::string& data);

} // namespace parabox

#endif // PARABOX_CORE_UTILS_HPP
