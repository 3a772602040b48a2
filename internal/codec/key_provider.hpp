#pragma once

#include "internal/codec/aes_gcm.hpp"

namespace offline::codec {

/*
  Source of the process's single symmetric key.

  GetOrCreateKey is idempotent: the first call creates (or loads) the key
  and every later call returns the same bytes.
*/
class KeyProvider {
 public:
  virtual ~KeyProvider() = default;

  virtual EncryptionKey GetOrCreateKey() = 0;

  // Replaces the active key; records written under the old key become undecryptable.
  virtual void SetKey(const EncryptionKey& key) = 0;
};

} // namespace offline::codec
