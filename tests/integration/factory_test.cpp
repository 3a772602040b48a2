#include "internal/factory.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"

namespace {

namespace fs = std::filesystem;

using namespace std::chrono_literals;

using offline::config::ConfigLoader;
using offline::factory::BuildCache;
using offline::factory::CacheOptionsFromConfig;
using offline::util::ManualClock;

fs::path TempDir(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  auto       dir   = fs::temp_directory_path() / ("offline_cache_factory_" + name + "_" + std::to_string(stamp));
  fs::create_directories(dir);
  return dir;
}

void TestDefaultsBuildInMemoryCache() {
  auto deps = BuildCache(ConfigLoader::Defaults());
  assert(deps.repository);
  assert(deps.key_provider);
  assert(deps.cache);
  assert(!deps.sweeper);

  const auto& options = deps.cache->Options();
  assert(options.quota_bytes == offline::quota::kDefaultQuotaBytes);
  assert(options.default_ttl_ms == offline::cache::kDefaultTtlMs);
  assert(options.compress && options.encrypt);
  assert(options.default_type_tag == "generic");
  assert(options.default_max_retries == 3);
  assert(options.default_priority == 1);

  assert(deps.cache->SetBytes("k", "v"));
  assert(deps.cache->GetBytes("k") == std::optional<std::string>("v"));
}

void TestConfigOverridesReachCacheOptions() {
  auto config = ConfigLoader::Defaults();
  config.mutable_cache()->set_quota_bytes(4096);
  config.mutable_cache()->set_default_ttl_ms(500);
  config.mutable_cache()->set_compress(false);
  config.mutable_cache()->set_default_type_tag("weather");
  config.mutable_sync_queue()->set_default_max_retries(6);
  config.mutable_sync_queue()->set_default_priority(4);

  auto options = CacheOptionsFromConfig(config);
  assert(options.quota_bytes == 4096);
  assert(options.default_ttl_ms == 500);
  assert(!options.compress);
  assert(options.encrypt);
  assert(options.default_type_tag == "weather");
  assert(options.default_max_retries == 6);
  assert(options.default_priority == 4);
}

#if OFFLINE_DB_SQLITE
void TestSqliteCacheSurvivesRestart() {
  const auto dir = TempDir("sqlite");

  auto config = ConfigLoader::Defaults();
  config.mutable_storage()->mutable_sqlite()->set_path((dir / "cache.db").string());
  config.mutable_key()->set_path((dir / "device.key").string());

  {
    auto deps = BuildCache(config);
    assert(deps.cache->SetBytes("city:42", "{\"aqi\":35}"));

    offline::cache::v1::SyncAction action;
    action.set_target("/api/report");
    deps.cache->QueueAction(action);
  }

  assert(fs::exists(dir / "device.key"));

  {
    auto deps = BuildCache(config);
    assert(deps.cache->GetBytes("city:42") == std::optional<std::string>("{\"aqi\":35}"));

    auto pending = deps.cache->PendingActions();
    assert(pending.size() == 1);
    assert(pending[0].action().target() == "/api/report");
  }

  fs::remove_all(dir);
}

void TestUnopenableSqlitePathFails() {
  auto config = ConfigLoader::Defaults();
  config.mutable_storage()->mutable_sqlite()->set_path("/nonexistent-offline-cache-dir/sub/cache.db");

  bool failed = false;
  try {
    (void)BuildCache(config);
  } catch (const std::runtime_error&) {
    failed = true;
  }
  assert(failed);
}
#endif

void TestSweeperPurgesExpiredRecords() {
  auto config = ConfigLoader::Defaults();
  config.mutable_cache()->set_sweep_interval_ms(10);

  auto clock = std::make_shared<ManualClock>(1'000);
  auto deps  = BuildCache(config, clock);
  assert(deps.sweeper);
  assert(deps.sweeper->Running());

  offline::cache::SetOptions brief;
  brief.ttl_ms = 5;
  assert(deps.cache->SetBytes("brief", "v", brief));
  assert(deps.cache->SetBytes("lasting", "v"));
  clock->Advance(10ms);

  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (deps.cache->Keys().size() != 1 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }

  deps.sweeper->Stop();
  assert(!deps.sweeper->Running());

  auto keys = deps.cache->Keys();
  assert(keys.size() == 1);
  assert(keys[0] == "lasting");
}

} // namespace

int main() {
  TestDefaultsBuildInMemoryCache();
  TestConfigOverridesReachCacheOptions();
#if OFFLINE_DB_SQLITE
  TestSqliteCacheSurvivesRestart();
  TestUnopenableSqlitePathFails();
#endif
  TestSweeperPurgesExpiredRecords();

  std::cout << "offline_integration_factory: pass\n";
  return 0;
}
