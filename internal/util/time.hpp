#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>

namespace offline::util {

/*
  Time utilities: the single place that controls the clock source.

  Everything that compares against record timestamps takes a ClockSource
  so expiry can be driven deterministically.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

class ClockSource {
 public:
  virtual ~ClockSource() = default;

  // wall clock, unix epoch milliseconds
  virtual uint64_t NowMs() const = 0;
};

class SystemClockSource final : public ClockSource {
 public:
  uint64_t NowMs() const override;
};

/*
  Manually advanced clock.
*/
class ManualClock final : public ClockSource {
 public:
  explicit ManualClock(uint64_t start_ms = 0) : now_ms_(start_ms) {
  }

  uint64_t NowMs() const override {
    return now_ms_.load();
  }

  void Set(uint64_t now_ms) {
    now_ms_.store(now_ms);
  }

  void Advance(std::chrono::milliseconds delta) {
    now_ms_.fetch_add(static_cast<uint64_t>(delta.count()));
  }

 private:
  std::atomic<uint64_t> now_ms_;
};

std::shared_ptr<const ClockSource> DefaultClock();

} // namespace offline::util
