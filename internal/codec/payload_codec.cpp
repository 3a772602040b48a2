#include "payload_codec.hpp"

#include <cstring>

#include "internal/codec/aes_gcm.hpp"
#include "internal/util/errors.hpp"

namespace offline::codec {

PayloadCodec::PayloadCodec(std::shared_ptr<Compressor> compressor, std::shared_ptr<KeyProvider> keys)
    : compressor_(std::move(compressor)), keys_(std::move(keys)) {
  if (!compressor_) throw util::InvalidArgument("PayloadCodec requires a compressor");
  if (!keys_) throw util::InvalidArgument("PayloadCodec requires a key provider");
}

std::shared_ptr<arrow::Buffer> PayloadCodec::Encode(const std::shared_ptr<arrow::Buffer>& plaintext, bool compress, bool encrypt) {
  if (!plaintext) throw util::InvalidArgument("payload must not be null");

  std::shared_ptr<arrow::Buffer> current = plaintext;

  if (compress) {
    current = compressor_->Compress(*current);
  }

  if (encrypt) {
    const auto sealed = AesGcmCipher::Encrypt(*current, keys_->GetOrCreateKey());

    auto framed = Unwrap(arrow::AllocateBuffer(static_cast<int64_t>(kNonceBytes) + sealed.ciphertext->size()));
    std::memcpy(framed->mutable_data(), sealed.nonce.data(), kNonceBytes);
    std::memcpy(framed->mutable_data() + kNonceBytes, sealed.ciphertext->data(), static_cast<size_t>(sealed.ciphertext->size()));
    current = std::shared_ptr<arrow::Buffer>(std::move(framed));
  }

  return current;
}

std::shared_ptr<arrow::Buffer> PayloadCodec::Decode(const std::shared_ptr<arrow::Buffer>& stored, bool compressed, bool encrypted) {
  if (!stored) throw util::InvalidArgument("payload must not be null");

  std::shared_ptr<arrow::Buffer> current = stored;

  if (encrypted) {
    if (current->size() < static_cast<int64_t>(kNonceBytes + kTagBytes)) {
      throw util::CodecError(util::CodecError::Kind::kAuthenticationFailed, "encrypted payload truncated");
    }

    Nonce nonce;
    std::memcpy(nonce.data(), current->data(), kNonceBytes);

    // zero-copy view over ciphertext || tag
    auto body = arrow::SliceBuffer(current, static_cast<int64_t>(kNonceBytes));
    current   = AesGcmCipher::Decrypt(*body, nonce, keys_->GetOrCreateKey());
  }

  if (compressed) {
    current = compressor_->Decompress(*current);
  }

  return current;
}

} // namespace offline::codec
