#include "compression.hpp"

#include <cstdint>
#include <cstring>
#include <limits>
#include <string>

#include "internal/util/errors.hpp"

namespace offline::codec {

namespace {

constexpr int64_t kHeaderBytes = 8;

// Refuse frames claiming more than this; protects the allocator from garbage headers.
constexpr uint64_t kMaxFrameBytes = uint64_t{1} << 32;

void WriteLength(uint8_t* out, uint64_t value) {
  for (int i = 0; i < kHeaderBytes; ++i) {
    out[i] = static_cast<uint8_t>(value >> (8 * i));
  }
}

uint64_t ReadLength(const uint8_t* in) {
  uint64_t value = 0;
  for (int i = 0; i < kHeaderBytes; ++i) {
    value |= static_cast<uint64_t>(in[i]) << (8 * i);
  }
  return value;
}

util::CodecError CompressionError(const std::string& msg) {
  return util::CodecError(util::CodecError::Kind::kCompression, msg);
}

std::shared_ptr<arrow::Buffer> EmptyBuffer() {
  return std::shared_ptr<arrow::Buffer>(Unwrap(arrow::AllocateBuffer(0)));
}

} // namespace

arrow::Compression::type ResolveCompression(offline::runtime::config::Compression compression) {
  switch (compression) {
    case offline::runtime::config::COMPRESSION_ZSTD:
      return arrow::Compression::ZSTD;
    case offline::runtime::config::COMPRESSION_LZ4_FRAME:
      return arrow::Compression::LZ4_FRAME;
    case offline::runtime::config::COMPRESSION_BROTLI:
      return arrow::Compression::BROTLI;
    case offline::runtime::config::COMPRESSION_SNAPPY:
      return arrow::Compression::SNAPPY;
    case offline::runtime::config::COMPRESSION_GZIP:
    case offline::runtime::config::COMPRESSION_UNSPECIFIED:
    default:
      return arrow::Compression::GZIP;
  }
}

Compressor::Compressor(arrow::Compression::type type) : type_(type) {
  auto codec = arrow::util::Codec::Create(type_);
  if (!codec.ok()) {
    throw util::CodecError(util::CodecError::Kind::kInternal, "compression codec unavailable: " + codec.status().ToString());
  }
  codec_ = std::move(codec).ValueUnsafe();
}

std::shared_ptr<arrow::Buffer> Compressor::Compress(const arrow::Buffer& input) {
  if (input.size() == 0) {
    return EmptyBuffer();
  }

  std::lock_guard lock(mutex_);

  const int64_t max_len = codec_->MaxCompressedLen(input.size(), input.data());
  auto          output  = Unwrap(arrow::AllocateResizableBuffer(kHeaderBytes + max_len));

  WriteLength(output->mutable_data(), static_cast<uint64_t>(input.size()));

  auto written = codec_->Compress(input.size(), input.data(), max_len, output->mutable_data() + kHeaderBytes);
  if (!written.ok()) {
    throw CompressionError("compress failed: " + written.status().ToString());
  }

  auto status = output->Resize(kHeaderBytes + *written, /*shrink_to_fit=*/true);
  if (!status.ok()) {
    throw util::CodecError(util::CodecError::Kind::kInternal, status.ToString());
  }
  return std::shared_ptr<arrow::Buffer>(std::move(output));
}

std::shared_ptr<arrow::Buffer> Compressor::Decompress(const arrow::Buffer& input) {
  if (input.size() == 0) {
    return EmptyBuffer();
  }
  if (input.size() < kHeaderBytes) {
    throw CompressionError("compressed frame truncated: missing length header");
  }

  const uint64_t expected = ReadLength(input.data());
  if (expected == 0 || expected > kMaxFrameBytes) {
    throw CompressionError("compressed frame has invalid length " + std::to_string(expected));
  }

  std::lock_guard lock(mutex_);

  auto output = Unwrap(arrow::AllocateBuffer(static_cast<int64_t>(expected)));

  auto written = codec_->Decompress(input.size() - kHeaderBytes, input.data() + kHeaderBytes, static_cast<int64_t>(expected),
                                    output->mutable_data());
  if (!written.ok()) {
    throw CompressionError("decompress failed: " + written.status().ToString());
  }
  if (static_cast<uint64_t>(*written) != expected) {
    throw CompressionError("decompressed " + std::to_string(*written) + " bytes, frame declares " + std::to_string(expected));
  }

  return std::shared_ptr<arrow::Buffer>(std::move(output));
}

} // namespace offline::codec
