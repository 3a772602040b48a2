#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "offline/cache/v1.hpp"

namespace offline::sync {

struct DeliveryResult {
  bool        ok = false;
  std::string error;

  static DeliveryResult Ok() {
    return {true, {}};
  }

  static DeliveryResult Failed(std::string msg) {
    return {false, std::move(msg)};
  }
};

// Replays one action against the network. Must tolerate duplicate delivery.
using Transport = std::function<DeliveryResult(const offline::cache::v1::SyncAction&)>;

struct FailedItem {
  uint64_t                           id = 0;
  offline::cache::v1::SyncAction     action;
  uint32_t                           attempts = 0;
  std::string                        last_error;
};

// Item whose state could not be written back; it stays queued unchanged.
struct StoreFailure {
  uint64_t    id = 0;
  std::string error;
};

struct DrainReport {
  std::vector<uint64_t>     succeeded;
  std::vector<uint64_t>     retried;
  std::vector<FailedItem>   permanently_failed;
  std::vector<StoreFailure> store_errors;
};

} // namespace offline::sync
