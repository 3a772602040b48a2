#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace offline::db::sqlite {

/*
  SQLite transaction wrapper.

  Write transactions use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Read transactions use BEGIN DEFERRED.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  enum class Mode { kWrite, kRead };

  SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

 private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

} // namespace offline::db::sqlite
