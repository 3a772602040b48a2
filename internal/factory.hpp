#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/cache/expiry_sweeper.hpp"
#include "internal/cache/offline_cache.hpp"
#include "internal/codec/key_provider.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace offline::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects behind one cache instance.
  The sweeper is null unless cache.sweep_interval_ms is set; otherwise it is
  already running and stops when the dependencies are destroyed.
*/
struct RuntimeDependencies {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<codec::KeyProvider>      key_provider;
  std::shared_ptr<cache::OfflineCache>     cache;
  std::unique_ptr<cache::ExpirySweeper>    sweeper;
};

cache::CacheOptions CacheOptionsFromConfig(const offline::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository> BuildRepository(const offline::runtime::config::RuntimeConfig& config);

std::shared_ptr<codec::KeyProvider> BuildKeyProvider(const offline::runtime::config::RuntimeConfig& config);

/*
  BuildCache

  Composition root: the ONLY place that knows concrete backends.
  Throws if the storage backend cannot be opened; without it there is no
  durable sync queue.
*/
RuntimeDependencies BuildCache(const offline::runtime::config::RuntimeConfig& config,
                               std::shared_ptr<const util::ClockSource>       clock = nullptr);

} // namespace offline::factory
