#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/codec/compression.hpp"
#include "internal/codec/key_provider.hpp"
#include "internal/codec/payload_codec.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/quota/quota_manager.hpp"
#include "internal/store/record_store.hpp"
#include "internal/sync/sync_queue.hpp"
#include "internal/util/time.hpp"
#include "offline/cache/v1.hpp"

namespace offline::cache {

constexpr uint64_t kDefaultTtlMs   = 3'600'000;
constexpr char     kDefaultTypeTag[] = "generic";

constexpr uint32_t kSnapshotVersion = 1;

// Per-call overrides; unset fields take the cache defaults.
struct SetOptions {
  std::optional<uint64_t>    ttl_ms;
  std::optional<bool>        compress;
  std::optional<bool>        encrypt;
  std::optional<std::string> type_tag;
};

struct CacheOptions {
  uint64_t    quota_bytes         = quota::kDefaultQuotaBytes;
  uint64_t    default_ttl_ms      = kDefaultTtlMs;
  bool        compress            = true;
  bool        encrypt             = true;
  std::string default_type_tag    = kDefaultTypeTag;
  uint32_t    default_max_retries = sync::kDefaultMaxRetries;
  int32_t     default_priority    = sync::kDefaultPriority;
};

struct StorageUsage {
  uint64_t    size_bytes   = 0;
  uint64_t    record_count = 0;
  std::string formatted; // e.g. "1.5 MB"
};

// Produces the value for a cache miss; nullopt or an exception means the fetch failed.
using Fetcher = std::function<std::optional<std::string>()>;

/*
  OfflineCache

  Best-effort persistent cache plus the offline action queue.

  Cache path (Set/Get/Remove/...): never throws. Failures are logged and
  degrade to a miss, false, or no-op. Expired and undecodable records are
  deleted when read.

  Queue path (QueueAction/FlushQueue): errors reach the caller, because a
  lost action is a correctness problem.

  Writers on one key are serialized; readers share.
*/
class OfflineCache {
 public:
  OfflineCache(std::shared_ptr<db::Repository> repository, std::shared_ptr<codec::KeyProvider> keys,
               std::shared_ptr<const util::ClockSource> clock, CacheOptions options = {},
               std::shared_ptr<codec::Compressor> compressor = nullptr);

  // Stores the protobuf-serialized value.
  bool Set(const std::string& key, const google::protobuf::Value& value, const SetOptions& options = {});
  bool SetBytes(const std::string& key, std::string_view bytes, const SetOptions& options = {});

  std::optional<google::protobuf::Value> Get(const std::string& key);
  std::optional<std::string>             GetBytes(const std::string& key);

  // Cache-or-fetch; concurrent callers for one key share a single fetch.
  std::optional<std::string> GetOrFetch(const std::string& key, const Fetcher& fetcher, const SetOptions& options = {});

  void Remove(const std::string& key);

  // Deletes every record; the sync queue is untouched.
  bool Clear();

  size_t RemoveByType(const std::string& type_tag);
  size_t PurgeExpired();

  std::vector<std::string> Keys();
  StorageUsage             Usage();

  // Backup of the stored (still encoded) records. Throws util::StoreError.
  offline::cache::v1::CacheSnapshot Export();

  // Replaces all records with the snapshot's. Throws util::InvalidArgument or util::StoreError.
  size_t Import(const offline::cache::v1::CacheSnapshot& snapshot);

  uint64_t QueueAction(const offline::cache::v1::SyncAction& action, std::optional<int32_t> priority = std::nullopt,
                       std::optional<uint32_t> max_retries = std::nullopt);

  sync::DrainReport FlushQueue(const sync::Transport& transport);

  std::vector<offline::cache::v1::SyncItem> PendingActions();

  const CacheOptions& Options() const {
    return options_;
  }

  // Keys whose lock entry is currently held; 0 when the cache is idle.
  size_t LockedKeyCount();

 private:
  /*
    Holds one key's lock for the guard's lifetime. The last holder to
    leave drops the key's entry from key_mutexes_.
  */
  template <typename Lock>
  class KeyLock {
   public:
    KeyLock(OfflineCache& cache, const std::string& key)
        : cache_(cache), key_(key), mutex_(cache.KeyMutex(key)), lock_(*mutex_) {}

    ~KeyLock() {
      lock_.unlock();
      cache_.ReleaseKeyMutex(key_, mutex_);
    }

    KeyLock(const KeyLock&)            = delete;
    KeyLock& operator=(const KeyLock&) = delete;

   private:
    OfflineCache&                      cache_;
    const std::string&                 key_;
    std::shared_ptr<std::shared_mutex> mutex_;
    Lock                               lock_;
  };

  using ExclusiveKeyLock = KeyLock<std::unique_lock<std::shared_mutex>>;
  using SharedKeyLock    = KeyLock<std::shared_lock<std::shared_mutex>>;

  std::shared_ptr<std::shared_mutex> KeyMutex(const std::string& key);
  void                               ReleaseKeyMutex(const std::string& key, std::shared_ptr<std::shared_mutex>& mutex);

  std::optional<std::string> LookupLocked(const std::string& key);
  bool                       StoreLocked(const std::string& key, std::string_view bytes, const SetOptions& options);
  void                       DeleteQuietly(const std::string& key, std::string_view reason);

  std::shared_ptr<const util::ClockSource> clock_;
  CacheOptions                             options_;

  store::RecordStore  store_;
  quota::QuotaManager quota_;
  sync::SyncQueue     queue_;
  codec::PayloadCodec codec_;

  std::mutex                                                          key_mutexes_guard_;
  std::unordered_map<std::string, std::shared_ptr<std::shared_mutex>> key_mutexes_;
};

} // namespace offline::cache
