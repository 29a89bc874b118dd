#pragma once

#include <optional>
#include <string>
#include <vector>

namespace schemafm {

// ============================================================================
// File Reading
// ============================================================================

struct ReadFileResult {
    bool ok = false;
    std::string error;
    std::string content;
};

ReadFileResult read_file(const std::string& path);

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir)
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// Append one line and fsync before returning. Used for checkpoint and
// summary files that must survive an interrupted batch.
AtomicWriteResult append_line(const std::string& path, const std::string& line);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Lowercase extension including the dot (".yaml"), empty if none
std::string get_extension(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Replace the extension of a path ("model.uvl" -> "model.meta.json")
std::string replace_extension(const std::string& path, const std::string& ext);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);
bool create_directories(const std::string& path);

// Regular files under a directory (recursive) whose extension is in `exts`,
// sorted by portable path so batch composition is stable between runs.
std::vector<std::string> list_files(const std::string& dir,
                                    const std::vector<std::string>& exts);

} // namespace schemafm
