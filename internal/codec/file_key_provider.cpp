#include "file_key_provider.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace offline::codec {

namespace fs = std::filesystem;

FileKeyProvider::FileKeyProvider(fs::path path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw util::InvalidArgument("key file path must not be empty");
  }
}

EncryptionKey FileKeyProvider::GetOrCreateKey() {
  std::lock_guard lock(mutex_);
  if (cached_) return *cached_;

  if (auto existing = ReadKeyFile()) {
    cached_ = *existing;
    return *cached_;
  }

  auto key = GenerateKey();
  WriteKeyFile(key);
  cached_ = key;

  OFFLINE_LOG_INFO("generated encryption key", {observability::StringField("path", path_.string())});
  return key;
}

void FileKeyProvider::SetKey(const EncryptionKey& key) {
  std::lock_guard lock(mutex_);
  WriteKeyFile(key);
  cached_ = key;
}

std::optional<EncryptionKey> FileKeyProvider::ReadKeyFile() const {
  std::error_code ec;
  if (!fs::exists(path_, ec)) return std::nullopt;

  std::ifstream in(path_, std::ios::binary);
  if (!in) {
    throw util::CodecError(util::CodecError::Kind::kInternal, "cannot open key file " + path_.string());
  }

  std::vector<char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (bytes.size() != kKeyBytes) {
    OFFLINE_LOG_WARN("key file has wrong length, regenerating", {observability::StringField("path", path_.string()),
                     observability::IntField("bytes", static_cast<int64_t>(bytes.size()))});
    return std::nullopt;
  }

  EncryptionKey key;
  for (std::size_t i = 0; i < kKeyBytes; ++i) {
    key[i] = static_cast<uint8_t>(bytes[i]);
  }
  return key;
}

void FileKeyProvider::WriteKeyFile(const EncryptionKey& key) const {
  std::error_code ec;
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw util::CodecError(util::CodecError::Kind::kInternal, "cannot create key directory: " + ec.message());
    }
  }

  fs::path tmp = path_;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::CodecError(util::CodecError::Kind::kInternal, "cannot write key file " + tmp.string());
    }
    out.write(reinterpret_cast<const char*>(key.data()), static_cast<std::streamsize>(key.size()));
    out.flush();
    if (!out) {
      throw util::CodecError(util::CodecError::Kind::kInternal, "short write to key file " + tmp.string());
    }
  }

  fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
  if (ec) {
    OFFLINE_LOG_WARN("cannot restrict key file permissions", {observability::StringField("path", tmp.string()),
                     observability::StringField("error", ec.message())});
  }

  fs::rename(tmp, path_, ec);
  if (ec) {
    fs::remove(tmp, ec);
    throw util::CodecError(util::CodecError::Kind::kInternal, "cannot install key file " + path_.string());
  }
}

} // namespace offline::codec
