// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 RegistrationStore - registrations held by the rendezvous point

 A registration is (namespace, peer id, addresses, expiry). Each write gets
 the next value of a store-wide counter; Discover returns registrations in
 counter order and pages with a cookie "<last counter>:<namespace>".

 Location (urn):
   ":memory:" or ""  registrations live in memory only
   <path>            JSON file, loaded on open, rewritten atomically after
                     every mutation, guarded by an exclusive "<path>.lock"

 Expired registrations are never returned and are purged when seen.

 Thread-safety: all methods are thread-safe (stream callbacks run on the
 host IO thread while the store is owned by the serve command).

 Errors throw util::Error: StorageError for I/O, lock and closed-store
 failures, InvalidArgument for a malformed cookie.
*/

#include "util/logging.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace rdvp {
namespace rendezvous {

constexpr const char *MEMORY_URN = ":memory:";

struct Registration {
  std::string ns;
  std::string peer;
  std::vector<std::string> addrs;
  int64_t expiry{0}; // unix seconds
  uint64_t counter{0};
};

struct DiscoverResult {
  std::vector<Registration> registrations;
  // Pass back to continue after the last returned registration
  std::string cookie;
};

class RegistrationStore {
public:
  static std::unique_ptr<RegistrationStore>
  Open(const std::string &urn, std::shared_ptr<spdlog::logger> logger =
                                   util::LogManager::GetLogger("storage"));

  ~RegistrationStore();

  RegistrationStore(const RegistrationStore &) = delete;
  RegistrationStore &operator=(const RegistrationStore &) = delete;

  /**
   * Insert or replace the (ns, peer) registration
   * @param ttl seconds from now
   * @return counter assigned to the registration
   */
  uint64_t Register(const std::string &peer, const std::string &ns,
                    const std::vector<std::string> &addrs, int64_t ttl);

  // Remove (ns, peer); an empty ns removes every registration of peer
  void Unregister(const std::string &ns, const std::string &peer);

  // Live registrations of peer across all namespaces
  size_t CountRegistrations(const std::string &peer);

  /**
   * Registrations in ns (every namespace if ns is empty) with a counter
   * above the cookie's, oldest first, at most limit entries
   */
  DiscoverResult Discover(const std::string &ns, const std::string &cookie,
                          size_t limit);

  // Release the file lock (idempotent); later calls throw StorageError
  void Close();

  bool is_open() const;
  bool is_persistent() const { return !path_.empty(); }
  const std::string &path() const { return path_; }

private:
  RegistrationStore(std::string path, std::shared_ptr<spdlog::logger> logger);

  using Key = std::pair<std::string, std::string>; // (ns, peer)

  void Load();
  // Write to disk; restores `backup` and throws on failure
  void Commit(std::map<uint64_t, Registration> backup, uint64_t backup_counter);
  void EnsureOpenLocked() const;
  void RebuildIndexLocked();
  void EraseLocked(uint64_t counter);
  void InsertLocked(Registration registration);
  // Drop expired entries, true if anything was removed
  bool PurgeExpiredLocked(int64_t now);

  std::string path_;
  std::string lock_path_;
  std::shared_ptr<spdlog::logger> logger_;

  mutable std::mutex mutex_;
  bool open_{true};
  uint64_t counter_{0};
  std::map<uint64_t, Registration> by_counter_;
  std::map<Key, uint64_t> index_;
  std::map<std::string, size_t> peer_counts_;
};

} // namespace rendezvous
} // namespace rdvp
