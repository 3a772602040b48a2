#include "time.hpp"

namespace offline::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t SystemClockSource::NowMs() const {
  return ToUnixMillis(Now());
}

std::shared_ptr<const ClockSource> DefaultClock() {
  static const auto clock = std::make_shared<SystemClockSource>();
  return clock;
}

} // namespace offline::util
