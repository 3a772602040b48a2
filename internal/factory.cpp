#include "factory.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/codec/compression.hpp"
#include "internal/codec/file_key_provider.hpp"
#include "internal/codec/memory_key_provider.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if OFFLINE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace offline::factory {

using offline::observability::StringField;

cache::CacheOptions CacheOptionsFromConfig(const offline::runtime::config::RuntimeConfig& config) {
  const auto& c = config.cache();

  cache::CacheOptions options;
  if (c.has_quota_bytes()) options.quota_bytes = c.quota_bytes();
  if (c.has_default_ttl_ms()) options.default_ttl_ms = c.default_ttl_ms();
  if (c.has_compress()) options.compress = c.compress();
  if (c.has_encrypt()) options.encrypt = c.encrypt();
  if (c.has_default_type_tag()) options.default_type_tag = c.default_type_tag();

  const auto& q = config.sync_queue();
  if (q.has_default_max_retries()) options.default_max_retries = q.default_max_retries();
  if (q.default_priority() != 0) options.default_priority = q.default_priority();
  return options;
}

std::shared_ptr<db::Repository> BuildRepository(const offline::runtime::config::RuntimeConfig& config) {
  const auto& storage = config.storage();
  if (storage.has_sqlite()) {
#if OFFLINE_DB_SQLITE
    try {
      auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(storage.sqlite().path());
      db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
      OFFLINE_LOG_INFO("sqlite storage opened", {StringField("path", storage.sqlite().path())});
      return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    } catch (const std::exception& e) {
      throw std::runtime_error("cannot open sqlite storage: " + std::string(e.what()));
    }
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<codec::KeyProvider> BuildKeyProvider(const offline::runtime::config::RuntimeConfig& config) {
  if (!config.key().path().empty()) {
    return std::make_shared<codec::FileKeyProvider>(config.key().path());
  }
  return std::make_shared<codec::MemoryKeyProvider>();
}

RuntimeDependencies BuildCache(const offline::runtime::config::RuntimeConfig& config, std::shared_ptr<const util::ClockSource> clock) {
  RuntimeDependencies deps;
  deps.repository   = BuildRepository(config);
  deps.key_provider = BuildKeyProvider(config);

  auto compressor = std::make_shared<codec::Compressor>(codec::ResolveCompression(config.cache().compression()));

  deps.cache = std::make_shared<cache::OfflineCache>(deps.repository, deps.key_provider, clock ? std::move(clock) : util::DefaultClock(),
                                                     CacheOptionsFromConfig(config), std::move(compressor));

  if (config.cache().sweep_interval_ms() > 0) {
    deps.sweeper = std::make_unique<cache::ExpirySweeper>(deps.cache, std::chrono::milliseconds(config.cache().sweep_interval_ms()));
    deps.sweeper->Start();
  }
  return deps;
}

} // namespace offline::factory
