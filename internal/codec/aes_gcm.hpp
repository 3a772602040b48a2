#pragma once

#include <arrow/buffer.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>

namespace offline::codec {

constexpr std::size_t kKeyBytes   = 32; // AES-256
constexpr std::size_t kNonceBytes = 12; // 96-bit GCM IV
constexpr std::size_t kTagBytes   = 16;

using EncryptionKey = std::array<uint8_t, kKeyBytes>;
using Nonce         = std::array<uint8_t, kNonceBytes>;

struct EncryptedPayload {
  // ciphertext followed by the 16 byte authentication tag
  std::shared_ptr<arrow::Buffer> ciphertext;
  Nonce                          nonce{};
};

// Cryptographically secure random bytes; throws CodecError(kInternal) on RNG failure.
void FillRandom(uint8_t* out, std::size_t len);

EncryptionKey GenerateKey();

/*
  AES-256-GCM authenticated encryption.

  Decrypt fails closed: any tag mismatch, wrong key, or truncated input
  throws util::CodecError(kAuthenticationFailed) and no plaintext is
  returned.
*/
class AesGcmCipher {
 public:
  static EncryptedPayload Encrypt(const arrow::Buffer& plaintext, const EncryptionKey& key);

  static std::shared_ptr<arrow::Buffer> Decrypt(const arrow::Buffer& ciphertext, const Nonce& nonce, const EncryptionKey& key);
};

} // namespace offline::codec
