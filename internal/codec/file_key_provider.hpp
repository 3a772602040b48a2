#pragma once

#include <filesystem>
#include <mutex>
#include <optional>

#include "internal/codec/key_provider.hpp"

namespace offline::codec {

/*
  Persists the key as 32 raw bytes at a fixed path (mode 0600).

  Writes go to "<path>.tmp" and are renamed into place so a crash never
  leaves a half-written key. A file of the wrong length is treated as
  absent and replaced with a fresh key.
*/
class FileKeyProvider final : public KeyProvider {
 public:
  explicit FileKeyProvider(std::filesystem::path path);

  EncryptionKey GetOrCreateKey() override;
  void          SetKey(const EncryptionKey& key) override;

  const std::filesystem::path& Path() const {
    return path_;
  }

 private:
  std::optional<EncryptionKey> ReadKeyFile() const;
  void                         WriteKeyFile(const EncryptionKey& key) const;

  std::filesystem::path        path_;
  std::mutex                   mutex_;
  std::optional<EncryptionKey> cached_;
};

} // namespace offline::codec
