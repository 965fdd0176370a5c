#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace zshrcman {

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

// ============================================================================
// File Helpers
// ============================================================================

// Read entire file; nullopt when it does not exist or cannot be opened
std::optional<std::string> read_file(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Create directories recursively
bool create_directories(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get all environment variables as a map
std::unordered_map<std::string, std::string> get_all_env();

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

} // namespace zshrcman
