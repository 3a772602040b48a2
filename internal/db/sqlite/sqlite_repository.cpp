#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace offline::db::sqlite {

using offline::db::ErrorCode;
using offline::db::Result;

namespace {

const std::vector<std::string> kBootstrapSql = {
    "CREATE TABLE IF NOT EXISTS cache_records (key TEXT PRIMARY KEY, payload BLOB NOT NULL, created_at_ms INTEGER NOT NULL, ttl_ms INTEGER NOT NULL, type_tag TEXT NOT NULL, compressed INTEGER NOT NULL, encrypted INTEGER NOT NULL, size_bytes INTEGER NOT NULL, write_seq INTEGER NOT NULL DEFAULT 0);",
    "CREATE INDEX IF NOT EXISTS cache_records_write_seq ON cache_records(write_seq);",
    "CREATE INDEX IF NOT EXISTS cache_records_type_tag ON cache_records(type_tag);",
    "CREATE TABLE IF NOT EXISTS sync_queue (id INTEGER PRIMARY KEY AUTOINCREMENT, action BLOB NOT NULL, priority INTEGER NOT NULL, retry_count INTEGER NOT NULL, max_retries INTEGER NOT NULL, enqueued_at_ms INTEGER NOT NULL);",
    "CREATE INDEX IF NOT EXISTS sync_queue_replay_order ON sync_queue(priority DESC, id ASC);"};

constexpr const char* kRecordColumns = "key,payload,created_at_ms,ttl_ms,type_tag,compressed,encrypted,size_bytes,write_seq";
constexpr const char* kSyncColumns   = "id,action,priority,retry_count,max_retries,enqueued_at_ms";

/*
  Finalizes the statement on every exit path.
*/
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  explicit operator bool() const {
    return st_ != nullptr;
  }

  sqlite3_stmt* get() const {
    return st_;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const uint8_t* data, int64_t size) {
  // zero-length blobs need a non-null pointer or sqlite binds NULL
  static const uint8_t kEmpty = 0;
  sqlite3_bind_blob64(st, idx, size > 0 ? data : &kEmpty, static_cast<sqlite3_uint64>(size), SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col))) : "";
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* b = sqlite3_column_blob(st, col);
  const int   n = sqlite3_column_bytes(st, col);
  return b ? std::string(static_cast<const char*>(b), static_cast<size_t>(n)) : std::string();
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

[[noreturn]] void ThrowRead(sqlite3* db, const char* what) {
  throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
}

model::CacheRecord ReadRecordRow(sqlite3_stmt* st) {
  model::CacheRecord r;
  r.key           = ColText(st, 0);
  r.payload       = arrow::Buffer::FromString(ColBlob(st, 1));
  r.created_at_ms = ColU64(st, 2);
  r.ttl_ms        = ColU64(st, 3);
  r.type_tag      = ColText(st, 4);
  r.compressed    = ColI32(st, 5) != 0;
  r.encrypted     = ColI32(st, 6) != 0;
  r.size_bytes    = ColU64(st, 7);
  r.write_seq     = ColU64(st, 8);
  return r;
}

model::SyncItemRecord ReadSyncRow(sqlite3_stmt* st) {
  model::SyncItemRecord item;
  item.id             = ColU64(st, 0);
  item.action         = ColBlob(st, 1);
  item.priority       = ColI32(st, 2);
  item.retry_count    = static_cast<uint32_t>(ColI32(st, 3));
  item.max_retries    = static_cast<uint32_t>(ColI32(st, 4));
  item.enqueued_at_ms = ColU64(st, 5);
  return item;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  // fail fast on a file with an incompatible layout
  db.Exec(std::string("SELECT ") + kRecordColumns + " FROM cache_records LIMIT 1;");
  db.Exec(std::string("SELECT ") + kSyncColumns + " FROM sync_queue LIMIT 1;");
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kWrite);
}

std::unique_ptr<db::Transaction> SqliteRepository::BeginRead() {
  return std::make_unique<SqliteTransaction>(db_, SqliteTransaction::Mode::kRead);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Cache records
// ------------------------------------------------------------------

Result SqliteRepository::PutRecord(Transaction& t, const model::CacheRecord& r) {
  auto* db = TX(t).Handle();

  if (r.key.empty()) return Result::Err(ErrorCode::ConstraintViolation, "empty key");

  Statement st(db,
               "INSERT INTO cache_records(key,payload,created_at_ms,ttl_ms,type_tag,compressed,encrypted,size_bytes,write_seq) "
               "VALUES(?,?,?,?,?,?,?,?,(SELECT COALESCE(MAX(write_seq),0)+1 FROM cache_records)) "
               "ON CONFLICT(key) DO UPDATE SET payload=excluded.payload, created_at_ms=excluded.created_at_ms, "
               "ttl_ms=excluded.ttl_ms, type_tag=excluded.type_tag, compressed=excluded.compressed, "
               "encrypted=excluded.encrypted, size_bytes=excluded.size_bytes, write_seq=excluded.write_seq;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.key);
  if (r.payload) {
    BindBlob(st.get(), 2, r.payload->data(), r.payload->size());
  } else {
    BindBlob(st.get(), 2, nullptr, 0);
  }
  BindU64(st.get(), 3, r.created_at_ms);
  BindU64(st.get(), 4, r.ttl_ms);
  BindText(st.get(), 5, r.type_tag);
  BindI32(st.get(), 6, r.compressed ? 1 : 0);
  BindI32(st.get(), 7, r.encrypted ? 1 : 0);
  BindU64(st.get(), 8, r.size_bytes);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::CacheRecord> SqliteRepository::GetRecord(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + kRecordColumns + " FROM cache_records WHERE key=?;");
  if (!st) ThrowRead(db, "prepare get record");

  BindText(st.get(), 1, key);

  int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) ThrowRead(db, "get record");

  return ReadRecordRow(st.get());
}

std::vector<model::CacheRecord> SqliteRepository::ListRecords(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + kRecordColumns + " FROM cache_records ORDER BY key;");
  if (!st) ThrowRead(db, "prepare list records");

  std::vector<model::CacheRecord> out;
  int                             rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadRecordRow(st.get()));
  }
  if (rc != SQLITE_DONE) ThrowRead(db, "list records");
  return out;
}

Result SqliteRepository::DeleteRecord(Transaction& t, const std::string& key) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM cache_records WHERE key=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, key);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteAllRecords(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM cache_records;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Sync queue
// ------------------------------------------------------------------

Result SqliteRepository::InsertSyncItem(Transaction& t, model::SyncItemRecord& item) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO sync_queue(action,priority,retry_count,max_retries,enqueued_at_ms) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindBlob(st.get(), 1, reinterpret_cast<const uint8_t*>(item.action.data()), static_cast<int64_t>(item.action.size()));
  BindI32(st.get(), 2, item.priority);
  BindI32(st.get(), 3, static_cast<int>(item.retry_count));
  BindI32(st.get(), 4, static_cast<int>(item.max_retries));
  BindU64(st.get(), 5, item.enqueued_at_ms);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res) {
    item.id = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  }
  return res;
}

std::vector<model::SyncItemRecord> SqliteRepository::ListSyncItems(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + kSyncColumns + " FROM sync_queue ORDER BY priority DESC, id ASC;");
  if (!st) ThrowRead(db, "prepare list sync items");

  std::vector<model::SyncItemRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadSyncRow(st.get()));
  }
  if (rc != SQLITE_DONE) ThrowRead(db, "list sync items");
  return out;
}

Result SqliteRepository::UpdateSyncItem(Transaction& t, const model::SyncItemRecord& item) {
  auto* db = TX(t).Handle();

  Statement st(db, "UPDATE sync_queue SET action=?,priority=?,retry_count=?,max_retries=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindBlob(st.get(), 1, reinterpret_cast<const uint8_t*>(item.action.data()), static_cast<int64_t>(item.action.size()));
  BindI32(st.get(), 2, item.priority);
  BindI32(st.get(), 3, static_cast<int>(item.retry_count));
  BindI32(st.get(), 4, static_cast<int>(item.max_retries));
  BindU64(st.get(), 5, item.id);

  auto res = Translate(db, sqlite3_step(st.get()));
  if (res && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound);
  }
  return res;
}

Result SqliteRepository::DeleteSyncItem(Transaction& t, uint64_t id) {
  auto* db = TX(t).Handle();

  Statement st(db, "DELETE FROM sync_queue WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, id);
  return Translate(db, sqlite3_step(st.get()));
}

} // namespace offline::db::sqlite
