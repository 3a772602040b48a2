#include "memory_key_provider.hpp"

namespace offline::codec {

MemoryKeyProvider::MemoryKeyProvider(const EncryptionKey& key) : key_(key) {
}

EncryptionKey MemoryKeyProvider::GetOrCreateKey() {
  std::lock_guard lock(mutex_);
  if (!key_) key_ = GenerateKey();
  return *key_;
}

void MemoryKeyProvider::SetKey(const EncryptionKey& key) {
  std::lock_guard lock(mutex_);
  key_ = key;
}

} // namespace offline::codec
