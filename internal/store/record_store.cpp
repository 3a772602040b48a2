#include "record_store.hpp"

#include <exception>

#include "internal/util/errors.hpp"

namespace offline::store {

namespace {

using util::StoreError;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::Busy:
      throw StoreError(StoreError::Kind::kUnavailable, message);
    default:
      throw StoreError(StoreError::Kind::kWriteFailed, message);
  }
}

template <typename Fn>
auto ReadOrThrow(const std::string& context, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const StoreError&) {
    throw;
  } catch (const std::exception& e) {
    throw StoreError(StoreError::Kind::kReadFailed, context + ": " + e.what());
  }
}

template <typename Fn>
void WriteOrThrow(const std::string& context, Fn&& fn) {
  try {
    fn();
  } catch (const StoreError&) {
    throw;
  } catch (const std::exception& e) {
    throw StoreError(StoreError::Kind::kWriteFailed, context + ": " + e.what());
  }
}

} // namespace

RecordStore::RecordStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw StoreError(StoreError::Kind::kUnavailable, "record store requires a repository");
  }
}

void RecordStore::Put(const db::model::CacheRecord& record) {
  WriteOrThrow("put record", [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->PutRecord(*tx, record), "put record");
    tx->Commit();
  });
}

std::optional<db::model::CacheRecord> RecordStore::Get(const std::string& key) {
  return ReadOrThrow("get record", [&] {
    auto tx     = repository_->BeginRead();
    auto record = repository_->GetRecord(*tx, key);
    tx->Commit();
    return record;
  });
}

void RecordStore::Delete(const std::string& key) {
  WriteOrThrow("delete record", [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->DeleteRecord(*tx, key), "delete record");
    tx->Commit();
  });
}

void RecordStore::DeleteMany(const std::vector<std::string>& keys) {
  if (keys.empty()) return;

  WriteOrThrow("delete records", [&] {
    auto tx = repository_->Begin();
    for (const auto& key : keys) {
      ThrowIfDbError(repository_->DeleteRecord(*tx, key), "delete records");
    }
    tx->Commit();
  });
}

std::vector<db::model::CacheRecord> RecordStore::ScanAll() {
  return ReadOrThrow("scan records", [&] {
    auto tx      = repository_->BeginRead();
    auto records = repository_->ListRecords(*tx);
    tx->Commit();
    return records;
  });
}

void RecordStore::Clear() {
  WriteOrThrow("clear records", [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->DeleteAllRecords(*tx), "clear records");
    tx->Commit();
  });
}

void RecordStore::ReplaceAll(const std::vector<db::model::CacheRecord>& records) {
  WriteOrThrow("replace records", [&] {
    auto tx = repository_->Begin();
    ThrowIfDbError(repository_->DeleteAllRecords(*tx), "replace records");
    for (const auto& record : records) {
      ThrowIfDbError(repository_->PutRecord(*tx, record), "replace records");
    }
    tx->Commit();
  });
}

std::vector<std::string> RecordStore::Keys() {
  std::vector<std::string> keys;
  for (auto& record : ScanAll()) {
    keys.push_back(std::move(record.key));
  }
  return keys;
}

} // namespace offline::store
