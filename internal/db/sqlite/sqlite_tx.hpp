#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace chronicle::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds the connection lock, then issues BEGIN IMMEDIATE:
    - grabs the database write lock early
    - avoids deadlock-y behavior later
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>          db_;
  std::unique_lock<std::timed_mutex> lock_;
  bool committed_ = false;
  bool finished_  = false;
};

}
