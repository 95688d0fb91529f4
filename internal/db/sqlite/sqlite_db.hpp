#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace causal::db::sqlite {

class SqliteTransaction;

/*
  Thin RAII wrapper around sqlite3*.

  Path ":memory:" gives a private in-memory database (no WAL).
  Tracks how many transactions are open on the connection so an inner
  one can run as a savepoint of the outer.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  friend class SqliteTransaction;

  sqlite3*    db_ = nullptr;
  std::string path_;
  bool        wal_mode_ = true;
  int         tx_depth_ = 0;
};

} // namespace causal::db::sqlite
