// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/fs_lock.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <map>
#include <memory>
#include <mutex>
#include <unistd.h>

namespace rdvp {
namespace util {

// Global mutex to protect g_file_locks map
static std::mutex g_file_locks_mutex;

// Locks currently held by this process, keyed by lock file path
static std::map<std::string, std::unique_ptr<FileLock>> g_file_locks;

static std::string GetErrorReason() { return std::strerror(errno); }

FileLock::FileLock(const fs::path &file) {
  // O_CLOEXEC: Don't leak fd to child processes (prevents lock inheritance)
  fd_ = open(file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd_ == -1) {
    reason_ = GetErrorReason();
  }
}

FileLock::~FileLock() {
  if (fd_ != -1) {
    // Closing the fd automatically releases the fcntl lock
    close(fd_);
  }
}

bool FileLock::TryLock() {
  if (fd_ == -1) {
    return false;
  }

  struct flock lock {};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = 0;
  lock.l_len = 0; // Lock entire file

  if (fcntl(fd_, F_SETLK, &lock) == -1) {
    reason_ = GetErrorReason();
    return false;
  }

  return true;
}

LockResult LockFile(const fs::path &lockfile, std::string *reason) {
  std::lock_guard<std::mutex> lock(g_file_locks_mutex);

  std::string key = fs::absolute(lockfile).lexically_normal().string();
  if (g_file_locks.find(key) != g_file_locks.end()) {
    if (reason) {
      *reason = "already locked by this process";
    }
    return LockResult::ErrorLock;
  }

  auto file_lock = std::make_unique<FileLock>(lockfile);
  if (!file_lock->IsOpen()) {
    if (reason) {
      *reason = file_lock->GetReason();
    }
    return LockResult::ErrorWrite;
  }

  if (!file_lock->TryLock()) {
    if (reason) {
      *reason = file_lock->GetReason();
    }
    return LockResult::ErrorLock;
  }

  g_file_locks.emplace(key, std::move(file_lock));
  return LockResult::Success;
}

void UnlockFile(const fs::path &lockfile) {
  std::lock_guard<std::mutex> lock(g_file_locks_mutex);

  std::string key = fs::absolute(lockfile).lexically_normal().string();
  g_file_locks.erase(key);
}

} // namespace util
} // namespace rdvp
