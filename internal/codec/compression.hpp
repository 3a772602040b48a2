#pragma once

#include <arrow/buffer.h>
#include <arrow/result.h>
#include <arrow/util/compression.h>

#include <memory>
#include <mutex>
#include <stdexcept>

#include "config/config.pb.h"

namespace offline::codec {

/*
  Helper: unwrap Arrow Result<T> or throw std::runtime_error
*/
template <typename T>
T Unwrap(arrow::Result<T> result) {
  if (!result.ok()) throw std::runtime_error(result.status().ToString());
  return std::move(result).ValueUnsafe();
}

arrow::Compression::type ResolveCompression(offline::runtime::config::Compression compression);

/*
  Reversible byte compression over one Arrow codec.

  Frame layout:
      [u64 little-endian uncompressed length][codec stream]

  Empty input maps to an empty frame and back. Decompress throws
  util::CodecError(kCompression) on truncated or invalid frames; it never
  returns bytes that did not decode to exactly the recorded length.

  Arrow one-shot codecs keep internal stream state, so calls are serialized.
*/
class Compressor {
 public:
  explicit Compressor(arrow::Compression::type type = arrow::Compression::GZIP);

  std::shared_ptr<arrow::Buffer> Compress(const arrow::Buffer& input);
  std::shared_ptr<arrow::Buffer> Decompress(const arrow::Buffer& input);

  arrow::Compression::type Type() const {
    return type_;
  }

 private:
  arrow::Compression::type            type_;
  std::unique_ptr<arrow::util::Codec> codec_;
  std::mutex                          mutex_;
};

} // namespace offline::codec
