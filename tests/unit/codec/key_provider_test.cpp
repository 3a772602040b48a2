#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/codec/file_key_provider.hpp"
#include "internal/codec/memory_key_provider.hpp"

namespace {

namespace fs = std::filesystem;

using offline::codec::EncryptionKey;
using offline::codec::FileKeyProvider;
using offline::codec::MemoryKeyProvider;

fs::path TempKeyPath(const std::string& name) {
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  auto       dir   = fs::temp_directory_path() / ("offline_cache_key_tests_" + std::to_string(stamp));
  return dir / name;
}

void TestMemoryProviderIsStable() {
  MemoryKeyProvider keys;
  auto              first = keys.GetOrCreateKey();
  assert(first == keys.GetOrCreateKey());

  EncryptionKey replacement{};
  replacement.fill(7);
  keys.SetKey(replacement);
  assert(keys.GetOrCreateKey() == replacement);
}

void TestFileProviderPersistsAcrossInstances() {
  const auto path = TempKeyPath("device.key");

  EncryptionKey first;
  {
    FileKeyProvider keys(path);
    first = keys.GetOrCreateKey();
    assert(first == keys.GetOrCreateKey());
  }

  assert(fs::exists(path));
  assert(fs::file_size(path) == offline::codec::kKeyBytes);
  assert(!fs::exists(fs::path(path.string() + ".tmp")));

  const auto perms = fs::status(path).permissions();
  assert((perms & (fs::perms::group_all | fs::perms::others_all)) == fs::perms::none);

  FileKeyProvider reopened(path);
  assert(reopened.GetOrCreateKey() == first);

  fs::remove_all(path.parent_path());
}

void TestFileProviderSetKeyOverwrites() {
  const auto path = TempKeyPath("device.key");

  EncryptionKey key{};
  key.fill(0x5a);
  {
    FileKeyProvider keys(path);
    keys.SetKey(key);
    assert(keys.GetOrCreateKey() == key);
  }

  FileKeyProvider reopened(path);
  assert(reopened.GetOrCreateKey() == key);

  fs::remove_all(path.parent_path());
}

void TestWrongLengthFileIsReplaced() {
  const auto path = TempKeyPath("device.key");
  fs::create_directories(path.parent_path());
  {
    std::ofstream out(path, std::ios::binary);
    out << "too-short";
  }

  FileKeyProvider keys(path);
  auto            key = keys.GetOrCreateKey();
  (void)key;
  assert(fs::file_size(path) == offline::codec::kKeyBytes);

  FileKeyProvider reopened(path);
  assert(reopened.GetOrCreateKey() == key);

  fs::remove_all(path.parent_path());
}

} // namespace

int main() {
  TestMemoryProviderIsStable();
  TestFileProviderPersistsAcrossInstances();
  TestFileProviderSetKeyOverwrites();
  TestWrongLengthFileIsReplaced();

  std::cout << "offline_unit_key_provider: pass\n";
  return 0;
}
