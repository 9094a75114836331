#pragma once

#include <optional>
#include <string>
#include <vector>

namespace askills {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// Parent directories are created when missing.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Same, then chmod the final file (used for hook bridge executables)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned int mode);

// Marker embedded in every temp file name created by atomic_write_file
constexpr const char* kTempMarker = ".tmp.";

// True if a file name looks like an atomic-write leftover
bool is_temp_artifact(const std::string& filename);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Absolute, lexically normalized form of a path
std::string absolute_path(const std::string& path);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Read an entire file as bytes; nullopt if unreadable
std::optional<std::string> read_file(const std::string& path);

// List directory entry names (not paths), sorted
std::vector<std::string> list_directory(const std::string& path);

// Recursively list regular files below a directory, as sorted relative paths
std::vector<std::string> list_files_recursive(const std::string& path);

// Create parent directories recursively
bool create_directories(const std::string& path);

// Remove a single file; true if it no longer exists afterwards
bool remove_file(const std::string& path);

// Remove `dir` and then each parent up to (excluding) `stop_at` while empty
void prune_empty_directories(const std::string& dir, const std::string& stop_at);

// True if the file is executable by its owner
bool is_executable(const std::string& path);

// ============================================================================
// Hashing
// ============================================================================

struct HashResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // Lowercase hex string (64 chars)
};

// Compute SHA-256 of in-memory data
HashResult compute_sha256(const std::string& data);

// Compute SHA-256 of a file's contents
HashResult compute_sha256_file(const std::string& file_path);

// "sha256:<hex>" or empty on failure
std::string digest_ref(const std::string& data);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

// Current UTC date as YYYY-MM-DD
std::string get_current_date();

// True when stdin is attached to a terminal
bool stdin_is_interactive();

} // namespace askills
