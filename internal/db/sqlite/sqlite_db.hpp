#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>

namespace chronicle::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by every thread of the process. Transactions
  take the connection lock for their whole lifetime, so statements from
  two transactions never interleave on the handle.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000));
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Blocks up to the busy timeout; throws std::runtime_error after that.
  std::unique_lock<std::timed_mutex> AcquireWriter();

 private:
  sqlite3*                  db_ = nullptr;
  std::string               path_;
  std::chrono::milliseconds busy_timeout_;
  std::timed_mutex          writer_;
};

} // namespace chronicle::db::sqlite
