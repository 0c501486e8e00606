#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace rdvp {
namespace util {

/**
 * Atomic file operations for crash-safe persistence
 *
 * Pattern:
 * 1. Write to temporary file (.tmp suffix)
 * 2. fsync() the file to ensure data is on disk
 * 3. fsync() the directory to ensure rename will be durable
 * 4. Atomic rename over original file
 */

/**
 * Write string to file atomically
 * @param mode File permissions of the new file (0600 for owner-only)
 * Returns true on success, false on failure
 */
bool atomic_write_file(const std::filesystem::path &path,
                       const std::string &data, int mode = 0644);

/**
 * Read entire file into string
 * Returns false if the file is missing, unreadable or larger than 100MB
 */
bool read_file_string(const std::filesystem::path &path, std::string &out);

/**
 * Create directory if it doesn't exist (recursive)
 * Returns true on success or if already exists
 */
bool ensure_directory(const std::filesystem::path &dir);

} // namespace util
} // namespace rdvp
