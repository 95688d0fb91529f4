#pragma once

#include <memory>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace causal::db::sqlite {

/*
  SQLite transaction wrapper.

  Writes use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Reads use BEGIN DEFERRED so they never block the writer under WAL.

  A transaction opened while another is live on the same connection
  becomes SAVEPOINT/RELEASE inside it and sees its uncommitted rows.
  Nested transactions must finish in LIFO order.
*/
class SqliteTransaction final : public db::Transaction {
public:
  enum class Mode { kRead, kWrite };

  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode = Mode::kWrite);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  // 0 for the outermost transaction.
  int Depth() const { return depth_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::string Savepoint() const;
  void Finish();

  std::shared_ptr<SqliteDB> db_;
  int depth_ = 0;
  bool committed_ = false;
  bool finished_ = false;
};

}
