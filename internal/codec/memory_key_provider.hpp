#pragma once

#include <mutex>
#include <optional>

#include "internal/codec/key_provider.hpp"

namespace offline::codec {

// Process-local key; generated on first use and lost at exit.
class MemoryKeyProvider final : public KeyProvider {
 public:
  MemoryKeyProvider() = default;
  explicit MemoryKeyProvider(const EncryptionKey& key);

  EncryptionKey GetOrCreateKey() override;
  void          SetKey(const EncryptionKey& key) override;

 private:
  std::mutex                   mutex_;
  std::optional<EncryptionKey> key_;
};

} // namespace offline::codec
