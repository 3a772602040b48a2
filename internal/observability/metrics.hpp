#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace offline::runtime::config {
class RuntimeConfig;
}

namespace offline::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"offline-cache"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t collection_interval_ms{1000};
};

enum class LookupOutcome {
  kHit,
  kMiss,
  kExpired,
  kCorrupt,
};

std::string_view ToString(LookupOutcome outcome);

bool InitializeMetrics(const offline::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

/*
  Process-wide cache instruments.

  Without ENABLE_OTEL every call compiles to a no-op.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordLookup(LookupOutcome outcome);
  void RecordWrite(bool success);
  void RecordEvictions(std::uint64_t records);
  void RecordDrain(std::uint64_t succeeded, std::uint64_t retried, std::uint64_t failed);
  void SetCacheOccupancyBytes(std::uint64_t bytes);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const offline::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownMetrics() {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordLookup(LookupOutcome) {
}

inline void Metrics::RecordWrite(bool) {
}

inline void Metrics::RecordEvictions(std::uint64_t) {
}

inline void Metrics::RecordDrain(std::uint64_t, std::uint64_t, std::uint64_t) {
}

inline void Metrics::SetCacheOccupancyBytes(std::uint64_t) {
}
#endif

inline std::string_view ToString(LookupOutcome outcome) {
  switch (outcome) {
    case LookupOutcome::kHit:
      return "hit";
    case LookupOutcome::kMiss:
      return "miss";
    case LookupOutcome::kExpired:
      return "expired";
    case LookupOutcome::kCorrupt:
      return "corrupt";
  }
  return "unknown";
}

} // namespace offline::observability
