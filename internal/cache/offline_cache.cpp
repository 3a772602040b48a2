#include "offline_cache.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/format.hpp"

namespace offline::cache {

using observability::IntField;
using observability::LookupOutcome;
using observability::Metrics;
using observability::StringField;

OfflineCache::OfflineCache(std::shared_ptr<db::Repository> repository, std::shared_ptr<codec::KeyProvider> keys,
                           std::shared_ptr<const util::ClockSource> clock, CacheOptions options,
                           std::shared_ptr<codec::Compressor> compressor)
    : clock_(clock ? std::move(clock) : util::DefaultClock()),
      options_(std::move(options)),
      store_(repository),
      quota_(options_.quota_bytes, clock_),
      queue_(repository, clock_),
      codec_(compressor ? std::move(compressor) : std::make_shared<codec::Compressor>(), std::move(keys)) {
  if (options_.default_ttl_ms == 0) throw util::InvalidArgument("default ttl must be positive");
  if (options_.default_type_tag.empty()) throw util::InvalidArgument("default type tag must not be empty");
  if (options_.default_max_retries == 0) throw util::InvalidArgument("default max retries must be at least 1");
}

std::shared_ptr<std::shared_mutex> OfflineCache::KeyMutex(const std::string& key) {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  auto&                       key_mutex = key_mutexes_[key];
  if (!key_mutex) {
    key_mutex = std::make_shared<std::shared_mutex>();
  }
  return key_mutex;
}

void OfflineCache::ReleaseKeyMutex(const std::string& key, std::shared_ptr<std::shared_mutex>& mutex) {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  mutex.reset();
  auto it = key_mutexes_.find(key);
  // copies are only taken under the guard, so a lone map reference means no waiters
  if (it != key_mutexes_.end() && it->second.use_count() == 1) {
    key_mutexes_.erase(it);
  }
}

size_t OfflineCache::LockedKeyCount() {
  std::lock_guard<std::mutex> lock(key_mutexes_guard_);
  return key_mutexes_.size();
}

void OfflineCache::DeleteQuietly(const std::string& key, std::string_view reason) {
  try {
    store_.Delete(key);
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("cache delete failed", {StringField("key", key), StringField("reason", reason), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

bool OfflineCache::StoreLocked(const std::string& key, std::string_view bytes, const SetOptions& options) {
  const uint64_t ttl_ms   = options.ttl_ms.value_or(options_.default_ttl_ms);
  const bool     compress = options.compress.value_or(options_.compress);
  const bool     encrypt  = options.encrypt.value_or(options_.encrypt);

  if (ttl_ms == 0) {
    OFFLINE_LOG_WARN("cache set rejected: ttl must be positive", {StringField("key", key)});
    Metrics::Instance().RecordWrite(false);
    return false;
  }

  try {
    db::model::CacheRecord record;
    record.key           = key;
    record.payload       = codec_.Encode(arrow::Buffer::FromString(std::string(bytes)), compress, encrypt);
    record.created_at_ms = clock_->NowMs();
    record.ttl_ms        = ttl_ms;
    record.type_tag      = options.type_tag.value_or(options_.default_type_tag);
    record.compressed    = compress;
    record.encrypted     = encrypt;
    record.size_bytes    = static_cast<uint64_t>(record.payload->size());

    store_.Put(record);
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("cache set failed", {StringField("key", key), StringField("error", e.what())});
    Metrics::Instance().RecordWrite(false);
    return false;
  }

  Metrics::Instance().RecordWrite(true);

  try {
    quota_.CheckAndEvict(store_);
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("quota check failed", {StringField("key", key), StringField("error", e.what())});
  }
  return true;
}

bool OfflineCache::SetBytes(const std::string& key, std::string_view bytes, const SetOptions& options) {
  if (key.empty()) {
    OFFLINE_LOG_WARN("cache set rejected: empty key");
    return false;
  }

  ExclusiveKeyLock key_lock(*this, key);
  return StoreLocked(key, bytes, options);
}

bool OfflineCache::Set(const std::string& key, const google::protobuf::Value& value, const SetOptions& options) {
  std::string bytes;
  if (!value.SerializeToString(&bytes)) {
    OFFLINE_LOG_WARN("cache set rejected: value not serializable", {StringField("key", key)});
    return false;
  }
  return SetBytes(key, bytes, options);
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

std::optional<std::string> OfflineCache::LookupLocked(const std::string& key) {
  std::optional<db::model::CacheRecord> record;
  try {
    record = store_.Get(key);
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("cache read failed", {StringField("key", key), StringField("error", e.what())});
    Metrics::Instance().RecordLookup(LookupOutcome::kMiss);
    return std::nullopt;
  }

  if (!record) {
    Metrics::Instance().RecordLookup(LookupOutcome::kMiss);
    return std::nullopt;
  }

  if (db::model::IsExpired(*record, clock_->NowMs())) {
    OFFLINE_LOG_DEBUG("cache record expired", {StringField("key", key)});
    DeleteQuietly(key, "expired");
    Metrics::Instance().RecordLookup(LookupOutcome::kExpired);
    return std::nullopt;
  }

  try {
    auto plaintext = codec_.Decode(record->payload, record->compressed, record->encrypted);
    Metrics::Instance().RecordLookup(LookupOutcome::kHit);
    return plaintext->ToString();
  } catch (const util::CodecError& e) {
    OFFLINE_LOG_WARN("cache record undecodable, dropping", {StringField("key", key), StringField("error", e.what())});
    DeleteQuietly(key, "corrupt");
    Metrics::Instance().RecordLookup(LookupOutcome::kCorrupt);
    return std::nullopt;
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("cache decode failed", {StringField("key", key), StringField("error", e.what())});
    Metrics::Instance().RecordLookup(LookupOutcome::kMiss);
    return std::nullopt;
  }
}

std::optional<std::string> OfflineCache::GetBytes(const std::string& key) {
  SharedKeyLock key_lock(*this, key);
  return LookupLocked(key);
}

std::optional<google::protobuf::Value> OfflineCache::Get(const std::string& key) {
  SharedKeyLock key_lock(*this, key);

  auto bytes = LookupLocked(key);
  if (!bytes) return std::nullopt;

  google::protobuf::Value value;
  if (!value.ParseFromString(*bytes)) {
    OFFLINE_LOG_WARN("cache value unparsable, dropping", {StringField("key", key)});
    DeleteQuietly(key, "unparsable");
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> OfflineCache::GetOrFetch(const std::string& key, const Fetcher& fetcher, const SetOptions& options) {
  if (!fetcher) return GetBytes(key);

  ExclusiveKeyLock key_lock(*this, key);

  if (auto cached = LookupLocked(key)) {
    return cached;
  }

  std::optional<std::string> fetched;
  try {
    fetched = fetcher();
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("cache fetch failed", {StringField("key", key), StringField("error", e.what())});
    return std::nullopt;
  }
  if (!fetched) {
    OFFLINE_LOG_DEBUG("cache fetch returned nothing", {StringField("key", key)});
    return std::nullopt;
  }

  // a failed write still hands the fetched value back
  StoreLocked(key, *fetched, options);
  return fetched;
}

// ------------------------------------------------------------------
// Deletes and maintenance
// ------------------------------------------------------------------

void OfflineCache::Remove(const std::string& key) {
  ExclusiveKeyLock key_lock(*this, key);
  DeleteQuietly(key, "remove");
}

bool OfflineCache::Clear() {
  try {
    store_.Clear();
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("cache clear failed", {StringField("error", e.what())});
    return false;
  }
  Metrics::Instance().SetCacheOccupancyBytes(0);
  OFFLINE_LOG_INFO("cache cleared");
  return true;
}

size_t OfflineCache::RemoveByType(const std::string& type_tag) {
  try {
    std::vector<std::string> victims;
    for (const auto& record : store_.ScanAll()) {
      if (record.type_tag == type_tag) victims.push_back(record.key);
    }
    store_.DeleteMany(victims);

    OFFLINE_LOG_INFO("cache records removed by type", {StringField("type_tag", type_tag),
                     IntField("removed", static_cast<int64_t>(victims.size()))});
    return victims.size();
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("cache remove by type failed", {StringField("type_tag", type_tag), StringField("error", e.what())});
    return 0;
  }
}

size_t OfflineCache::PurgeExpired() {
  try {
    const uint64_t           now = clock_->NowMs();
    std::vector<std::string> victims;
    for (const auto& record : store_.ScanAll()) {
      if (db::model::IsExpired(record, now)) victims.push_back(record.key);
    }
    store_.DeleteMany(victims);

    if (!victims.empty()) {
      OFFLINE_LOG_DEBUG("expired cache records purged", {IntField("removed", static_cast<int64_t>(victims.size()))});
    }
    return victims.size();
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("cache purge failed", {StringField("error", e.what())});
    return 0;
  }
}

std::vector<std::string> OfflineCache::Keys() {
  try {
    return store_.Keys();
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("cache key listing failed", {StringField("error", e.what())});
    return {};
  }
}

StorageUsage OfflineCache::Usage() {
  StorageUsage usage;
  try {
    for (const auto& record : store_.ScanAll()) {
      usage.size_bytes += record.size_bytes;
      usage.record_count++;
    }
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("cache usage scan failed", {StringField("error", e.what())});
    usage = StorageUsage{};
  }
  usage.formatted = util::FormatBytes(usage.size_bytes);
  return usage;
}

// ------------------------------------------------------------------
// Backup
// ------------------------------------------------------------------

offline::cache::v1::CacheSnapshot OfflineCache::Export() {
  offline::cache::v1::CacheSnapshot snapshot;
  snapshot.set_version(kSnapshotVersion);
  snapshot.set_exported_at_ms(clock_->NowMs());

  for (const auto& record : store_.ScanAll()) {
    auto* out = snapshot.add_records();
    out->set_key(record.key);
    if (record.payload) out->set_payload(record.payload->ToString());
    out->set_created_at_ms(record.created_at_ms);
    out->set_ttl_ms(record.ttl_ms);
    out->set_type_tag(record.type_tag);
    out->set_compressed(record.compressed);
    out->set_encrypted(record.encrypted);
    out->set_size_bytes(record.size_bytes);
  }
  return snapshot;
}

size_t OfflineCache::Import(const offline::cache::v1::CacheSnapshot& snapshot) {
  if (snapshot.version() != kSnapshotVersion) {
    throw util::InvalidArgument("unsupported cache snapshot version " + std::to_string(snapshot.version()));
  }

  std::vector<db::model::CacheRecord> records;
  records.reserve(static_cast<size_t>(snapshot.records_size()));
  for (const auto& in : snapshot.records()) {
    if (in.key().empty()) throw util::InvalidArgument("cache snapshot contains a record without a key");
    if (in.ttl_ms() == 0) throw util::InvalidArgument("cache snapshot record '" + in.key() + "' has no ttl");

    db::model::CacheRecord record;
    record.key           = in.key();
    record.payload       = arrow::Buffer::FromString(in.payload());
    record.created_at_ms = in.created_at_ms();
    record.ttl_ms        = in.ttl_ms();
    record.type_tag      = in.type_tag().empty() ? options_.default_type_tag : in.type_tag();
    record.compressed    = in.compressed();
    record.encrypted     = in.encrypted();
    // sizes are recomputed, never trusted
    record.size_bytes = static_cast<uint64_t>(in.payload().size());
    records.push_back(std::move(record));
  }

  store_.ReplaceAll(records);

  OFFLINE_LOG_INFO("cache snapshot imported", {IntField("records", static_cast<int64_t>(records.size()))});

  try {
    quota_.CheckAndEvict(store_);
  } catch (const std::exception& e) {
    OFFLINE_LOG_WARN("quota check after import failed", {StringField("error", e.what())});
  }
  return records.size();
}

// ------------------------------------------------------------------
// Sync queue pass-through
// ------------------------------------------------------------------

uint64_t OfflineCache::QueueAction(const offline::cache::v1::SyncAction& action, std::optional<int32_t> priority,
                                   std::optional<uint32_t> max_retries) {
  return queue_.Enqueue(action, priority.value_or(options_.default_priority), max_retries.value_or(options_.default_max_retries));
}

sync::DrainReport OfflineCache::FlushQueue(const sync::Transport& transport) {
  return queue_.Drain(transport);
}

std::vector<offline::cache::v1::SyncItem> OfflineCache::PendingActions() {
  return queue_.Pending();
}

} // namespace offline::cache
