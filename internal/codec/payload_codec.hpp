#pragma once

#include <arrow/buffer.h>

#include <memory>

#include "internal/codec/compression.hpp"
#include "internal/codec/key_provider.hpp"

namespace offline::codec {

/*
  Fixed-order payload pipeline.

  Encode:  plaintext -> compress? -> encrypt? -> stored bytes
  Decode:  stored bytes -> decrypt? -> decompress? -> plaintext

  Encrypted payloads are stored as nonce(12) || ciphertext || tag(16).
  Decode either returns the exact original bytes or throws util::CodecError.
*/
class PayloadCodec {
 public:
  PayloadCodec(std::shared_ptr<Compressor> compressor, std::shared_ptr<KeyProvider> keys);

  std::shared_ptr<arrow::Buffer> Encode(const std::shared_ptr<arrow::Buffer>& plaintext, bool compress, bool encrypt);

  std::shared_ptr<arrow::Buffer> Decode(const std::shared_ptr<arrow::Buffer>& stored, bool compressed, bool encrypted);

 private:
  std::shared_ptr<Compressor>  compressor_;
  std::shared_ptr<KeyProvider> keys_;
};

} // namespace offline::codec
