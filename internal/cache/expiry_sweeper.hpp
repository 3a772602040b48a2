#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace offline::cache {

class OfflineCache;

/*
  Periodically purges expired records.

  Optional: reads already treat expired records as misses, so this only
  reclaims space earlier.
*/
class ExpirySweeper {
 public:
  ExpirySweeper(std::shared_ptr<OfflineCache> cache, std::chrono::milliseconds interval);
  ~ExpirySweeper();

  ExpirySweeper(const ExpirySweeper&)            = delete;
  ExpirySweeper& operator=(const ExpirySweeper&) = delete;

  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }

 private:
  void Loop();

  std::shared_ptr<OfflineCache> cache_;
  std::chrono::milliseconds     interval_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              wake_mutex_;
  std::condition_variable wake_;
};

} // namespace offline::cache
