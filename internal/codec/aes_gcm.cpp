#include "aes_gcm.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <climits>
#include <string>

#include "internal/codec/compression.hpp"
#include "internal/util/errors.hpp"

namespace offline::codec {

namespace {

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const {
    EVP_CIPHER_CTX_free(ctx);
  }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

std::string OpenSslError(const char* what) {
  char buf[256] = {0};
  ERR_error_string_n(ERR_get_error(), buf, sizeof(buf));
  return std::string(what) + ": " + buf;
}

util::CodecError Internal(const char* what) {
  return util::CodecError(util::CodecError::Kind::kInternal, OpenSslError(what));
}

util::CodecError AuthFailed(const std::string& msg) {
  return util::CodecError(util::CodecError::Kind::kAuthenticationFailed, msg);
}

CipherCtx NewContext() {
  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) throw Internal("EVP_CIPHER_CTX_new");
  return ctx;
}

} // namespace

void FillRandom(uint8_t* out, std::size_t len) {
  if (len > static_cast<std::size_t>(INT_MAX) || RAND_bytes(out, static_cast<int>(len)) != 1) {
    throw Internal("RAND_bytes");
  }
}

EncryptionKey GenerateKey() {
  EncryptionKey key;
  FillRandom(key.data(), key.size());
  return key;
}

EncryptedPayload AesGcmCipher::Encrypt(const arrow::Buffer& plaintext, const EncryptionKey& key) {
  if (plaintext.size() > INT_MAX - static_cast<int64_t>(kTagBytes)) {
    throw util::CodecError(util::CodecError::Kind::kInternal, "plaintext too large for AES-GCM");
  }

  EncryptedPayload out;
  FillRandom(out.nonce.data(), out.nonce.size());

  auto ctx = NewContext();
  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) throw Internal("EncryptInit");
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceBytes), nullptr) != 1) throw Internal("SET_IVLEN");
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), out.nonce.data()) != 1) throw Internal("EncryptInit key/iv");

  auto buffer = Unwrap(arrow::AllocateBuffer(plaintext.size() + static_cast<int64_t>(kTagBytes)));
  auto* dst   = buffer->mutable_data();

  int len   = 0;
  int total = 0;
  if (plaintext.size() > 0) {
    if (EVP_EncryptUpdate(ctx.get(), dst, &len, plaintext.data(), static_cast<int>(plaintext.size())) != 1) throw Internal("EncryptUpdate");
    total = len;
  }
  if (EVP_EncryptFinal_ex(ctx.get(), dst + total, &len) != 1) throw Internal("EncryptFinal");
  total += len;

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagBytes), dst + total) != 1) throw Internal("GET_TAG");

  out.ciphertext = std::shared_ptr<arrow::Buffer>(std::move(buffer));
  return out;
}

std::shared_ptr<arrow::Buffer> AesGcmCipher::Decrypt(const arrow::Buffer& ciphertext, const Nonce& nonce, const EncryptionKey& key) {
  if (ciphertext.size() < static_cast<int64_t>(kTagBytes)) {
    throw AuthFailed("ciphertext shorter than authentication tag");
  }

  const int64_t body_len = ciphertext.size() - static_cast<int64_t>(kTagBytes);
  const auto*   tag      = ciphertext.data() + body_len;

  auto ctx = NewContext();
  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) throw Internal("DecryptInit");
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceBytes), nullptr) != 1) throw Internal("SET_IVLEN");
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) throw Internal("DecryptInit key/iv");

  // +1 keeps the allocation non-empty for zero-length bodies
  auto buffer = Unwrap(arrow::AllocateResizableBuffer(body_len + 1));
  auto* dst   = buffer->mutable_data();

  int len   = 0;
  int total = 0;
  if (body_len > 0) {
    if (EVP_DecryptUpdate(ctx.get(), dst, &len, ciphertext.data(), static_cast<int>(body_len)) != 1) {
      throw AuthFailed("AES-GCM decrypt update failed");
    }
    total = len;
  }

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagBytes), const_cast<uint8_t*>(tag)) != 1) {
    throw Internal("SET_TAG");
  }

  // Tag verification happens here; on mismatch the decrypted bytes are discarded with the buffer.
  if (EVP_DecryptFinal_ex(ctx.get(), dst + total, &len) != 1) {
    ERR_clear_error();
    throw AuthFailed("AES-GCM authentication failed");
  }
  total += len;

  auto status = buffer->Resize(total, /*shrink_to_fit=*/true);
  if (!status.ok()) throw util::CodecError(util::CodecError::Kind::kInternal, status.ToString());

  return std::shared_ptr<arrow::Buffer>(std::move(buffer));
}

} // namespace offline::codec
