// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace rdvp {
namespace util {

namespace fs = std::filesystem;

/**
 * Exclusive advisory lock on a file, held while the object lives
 *
 * Uses fcntl() record locks. Those are per-process, so LockFile() keeps a
 * process-wide registry as well: a second LockFile() on the same path from
 * this process fails just like one from another process.
 *
 * Simplified from Bitcoin Core's fsbridge::FileLock
 */
class FileLock {
public:
  FileLock() = delete;
  FileLock(const FileLock &) = delete;
  FileLock(FileLock &&) = delete;

  explicit FileLock(const fs::path &file);
  ~FileLock();

  /**
   * Try to acquire exclusive lock on file
   * @return true if lock acquired, false otherwise
   */
  bool TryLock();

  /**
   * Get reason for lock failure
   */
  const std::string &GetReason() const { return reason_; }

  bool IsOpen() const { return fd_ != -1; }

private:
  std::string reason_;
  int fd_{-1};
};

/**
 * Result of lock attempt
 */
enum class LockResult {
  Success,    // Lock acquired successfully
  ErrorWrite, // Could not create lock file
  ErrorLock,  // Lock already held (by this or another process)
};

/**
 * Create (if needed) and exclusively lock lockfile
 *
 * @param reason if non-null, receives the OS error on failure
 */
LockResult LockFile(const fs::path &lockfile, std::string *reason = nullptr);

/**
 * Release a lock taken with LockFile (no-op if not held)
 */
void UnlockFile(const fs::path &lockfile);

} // namespace util
} // namespace rdvp
