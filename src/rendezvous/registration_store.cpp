// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "rendezvous/registration_store.hpp"
#include "util/error.hpp"
#include "util/files.hpp"
#include "util/fs_lock.hpp"
#include "util/string_parsing.hpp"
#include "util/time.hpp"
#include <filesystem>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace rdvp {
namespace rendezvous {

using util::Error;
using util::ErrorCode;

namespace {

constexpr int STORE_FORMAT_VERSION = 1;

std::string MakeCookie(uint64_t counter, const std::string &ns) {
  return std::to_string(counter) + ":" + ns;
}

// Counter encoded in cookie; throws InvalidArgument
uint64_t ParseCookie(const std::string &cookie, const std::string &ns) {
  size_t colon = cookie.find(':');
  if (colon == std::string::npos) {
    throw Error(ErrorCode::InvalidArgument, "invalid cookie");
  }
  auto counter = util::SafeParseInt64(cookie.substr(0, colon), 0,
                                      std::numeric_limits<int64_t>::max());
  if (!counter || cookie.substr(colon + 1) != ns) {
    throw Error(ErrorCode::InvalidArgument, "invalid cookie");
  }
  return static_cast<uint64_t>(*counter);
}

} // anonymous namespace

std::unique_ptr<RegistrationStore>
RegistrationStore::Open(const std::string &urn,
                        std::shared_ptr<spdlog::logger> logger) {
  std::string path = (urn == MEMORY_URN) ? "" : urn;
  std::unique_ptr<RegistrationStore> store(
      new RegistrationStore(path, std::move(logger)));
  if (store->is_persistent()) {
    store->Load();
  }
  store->logger_->debug("registration store opened ({})",
                        store->is_persistent() ? store->path_ : MEMORY_URN);
  return store;
}

RegistrationStore::RegistrationStore(std::string path,
                                     std::shared_ptr<spdlog::logger> logger)
    : path_(std::move(path)), logger_(std::move(logger)) {}

RegistrationStore::~RegistrationStore() { Close(); }

void RegistrationStore::Load() {
  std::filesystem::path file(path_);
  if (file.has_parent_path() && !util::ensure_directory(file.parent_path())) {
    throw Error(ErrorCode::StorageError,
                "cannot create directory " + file.parent_path().string());
  }

  // Close() releases lock_path_, so it is only set once the lock is ours
  std::string lock_path = path_ + ".lock";
  std::string reason;
  switch (util::LockFile(lock_path, &reason)) {
  case util::LockResult::Success:
    lock_path_ = lock_path;
    break;
  case util::LockResult::ErrorWrite:
    throw Error(ErrorCode::StorageError,
                "cannot create lock file " + lock_path + ": " + reason);
  case util::LockResult::ErrorLock:
    throw Error(ErrorCode::StorageError, "registration store " + path_ +
                                             " is already in use: " + reason);
  }

  std::string data;
  if (!std::filesystem::exists(file)) {
    logger_->debug("no registration store at {}, starting empty", path_);
    return;
  }
  if (!util::read_file_string(file, data)) {
    throw Error(ErrorCode::StorageError, "cannot read " + path_);
  }

  try {
    json j = json::parse(data);
    int version = j.value("version", 0);
    if (version != STORE_FORMAT_VERSION) {
      throw Error(ErrorCode::StorageError,
                  "unsupported store format version " + std::to_string(version));
    }
    counter_ = j.value("counter", uint64_t(0));

    int64_t now = util::GetTime();
    size_t expired = 0;
    for (const auto &entry : j.at("registrations")) {
      Registration r;
      r.ns = entry.at("ns").get<std::string>();
      r.peer = entry.at("peer").get<std::string>();
      r.addrs = entry.at("addrs").get<std::vector<std::string>>();
      r.expiry = entry.at("expiry").get<int64_t>();
      r.counter = entry.at("counter").get<uint64_t>();
      if (r.expiry <= now) {
        ++expired;
        continue;
      }
      if (r.counter > counter_) {
        counter_ = r.counter;
      }
      InsertLocked(std::move(r));
    }
    logger_->info("loaded {} registrations from {} (skipped {} expired)",
                  by_counter_.size(), path_, expired);
  } catch (const json::exception &e) {
    throw Error(ErrorCode::StorageError, "corrupt registration store " + path_ +
                                             ": " + e.what());
  }
}

void RegistrationStore::Commit(std::map<uint64_t, Registration> backup,
                               uint64_t backup_counter) {
  if (!is_persistent()) {
    return;
  }

  json registrations = json::array();
  for (const auto &[counter, r] : by_counter_) {
    registrations.push_back({{"ns", r.ns},
                             {"peer", r.peer},
                             {"addrs", r.addrs},
                             {"expiry", r.expiry},
                             {"counter", r.counter}});
  }
  json j = {{"version", STORE_FORMAT_VERSION},
            {"counter", counter_},
            {"registrations", registrations}};

  if (!util::atomic_write_file(path_, j.dump(2), 0600)) {
    logger_->error("failed to save registration store {}", path_);
    by_counter_ = std::move(backup);
    counter_ = backup_counter;
    RebuildIndexLocked();
    throw Error(ErrorCode::StorageError, "cannot write " + path_);
  }
  logger_->trace("saved {} registrations to {}", by_counter_.size(), path_);
}

void RegistrationStore::EnsureOpenLocked() const {
  if (!open_) {
    throw Error(ErrorCode::StorageError, "registration store is closed");
  }
}

void RegistrationStore::RebuildIndexLocked() {
  index_.clear();
  peer_counts_.clear();
  for (const auto &[counter, r] : by_counter_) {
    index_[{r.ns, r.peer}] = counter;
    ++peer_counts_[r.peer];
  }
}

void RegistrationStore::InsertLocked(Registration registration) {
  uint64_t counter = registration.counter;
  index_[{registration.ns, registration.peer}] = counter;
  ++peer_counts_[registration.peer];
  by_counter_.emplace(counter, std::move(registration));
}

void RegistrationStore::EraseLocked(uint64_t counter) {
  auto it = by_counter_.find(counter);
  if (it == by_counter_.end()) {
    return;
  }
  const Registration &r = it->second;
  index_.erase({r.ns, r.peer});
  auto count = peer_counts_.find(r.peer);
  if (count != peer_counts_.end() && --count->second == 0) {
    peer_counts_.erase(count);
  }
  by_counter_.erase(it);
}

bool RegistrationStore::PurgeExpiredLocked(int64_t now) {
  std::vector<uint64_t> expired;
  for (const auto &[counter, r] : by_counter_) {
    if (r.expiry <= now) {
      expired.push_back(counter);
    }
  }
  for (uint64_t counter : expired) {
    EraseLocked(counter);
  }
  if (!expired.empty()) {
    logger_->debug("purged {} expired registrations", expired.size());
  }
  return !expired.empty();
}

uint64_t RegistrationStore::Register(const std::string &peer, const std::string &ns,
                                     const std::vector<std::string> &addrs,
                                     int64_t ttl) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpenLocked();

  auto backup = is_persistent() ? by_counter_ : std::map<uint64_t, Registration>{};
  uint64_t backup_counter = counter_;

  int64_t now = util::GetTime();
  PurgeExpiredLocked(now);

  auto existing = index_.find({ns, peer});
  if (existing != index_.end()) {
    EraseLocked(existing->second);
  }

  Registration r;
  r.ns = ns;
  r.peer = peer;
  r.addrs = addrs;
  r.expiry = now + ttl;
  r.counter = ++counter_;
  InsertLocked(r);

  Commit(std::move(backup), backup_counter);

  logger_->debug("registered {} in '{}' until {}", peer, ns, util::FormatExpiry(r.expiry, now));
  return r.counter;
}

void RegistrationStore::Unregister(const std::string &ns, const std::string &peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpenLocked();

  auto backup = is_persistent() ? by_counter_ : std::map<uint64_t, Registration>{};

  std::vector<uint64_t> doomed;
  for (const auto &[counter, r] : by_counter_) {
    if (r.peer == peer && (ns.empty() || r.ns == ns)) {
      doomed.push_back(counter);
    }
  }
  if (doomed.empty()) {
    return;
  }
  for (uint64_t counter : doomed) {
    EraseLocked(counter);
  }

  Commit(std::move(backup), counter_);
  logger_->debug("unregistered {} from {}", peer, ns.empty() ? "all namespaces" : "'" + ns + "'");
}

size_t RegistrationStore::CountRegistrations(const std::string &peer) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpenLocked();

  int64_t now = util::GetTime();
  size_t count = 0;
  for (const auto &[counter, r] : by_counter_) {
    if (r.peer == peer && r.expiry > now) {
      ++count;
    }
  }
  return count;
}

DiscoverResult RegistrationStore::Discover(const std::string &ns,
                                           const std::string &cookie,
                                           size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpenLocked();

  uint64_t after = cookie.empty() ? 0 : ParseCookie(cookie, ns);

  int64_t now = util::GetTime();
  auto backup = is_persistent() ? by_counter_ : std::map<uint64_t, Registration>{};
  if (PurgeExpiredLocked(now)) {
    Commit(std::move(backup), counter_);
  }

  DiscoverResult result;
  uint64_t last = after;
  for (auto it = by_counter_.upper_bound(after);
       it != by_counter_.end() && result.registrations.size() < limit; ++it) {
    if (!ns.empty() && it->second.ns != ns) {
      continue;
    }
    result.registrations.push_back(it->second);
    last = it->first;
  }
  result.cookie = MakeCookie(last, ns);
  return result;
}

void RegistrationStore::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!open_) {
    return;
  }
  open_ = false;
  if (!lock_path_.empty()) {
    util::UnlockFile(lock_path_);
  }
  logger_->debug("registration store closed");
}

bool RegistrationStore::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return open_;
}

} // namespace rendezvous
} // namespace rdvp
