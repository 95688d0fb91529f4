#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace causal::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, Mode mode)
    : db_(std::move(db)), depth_(db_->tx_depth_) {
  if (depth_ == 0) {
    db_->Exec(mode == Mode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
  } else {
    db_->Exec("SAVEPOINT " + Savepoint() + ";");
  }
  db_->tx_depth_++;
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    try {
      Rollback();
    } catch (const std::exception& e) {
      CAUSAL_LOG_ERROR("sqlite rollback failed",
                       {causal::observability::StringField("error", e.what()),
                        causal::observability::IntField("depth", depth_)});
      Finish();
    }
  }
}

std::string SqliteTransaction::Savepoint() const {
  return "causal_tx_" + std::to_string(depth_);
}

void SqliteTransaction::Finish() {
  if (finished_) return;
  finished_ = true;
  db_->tx_depth_--;
}

void SqliteTransaction::Commit() {
  db_->Exec(depth_ == 0 ? std::string("COMMIT;") : "RELEASE " + Savepoint() + ";");
  committed_ = true;
  Finish();
}

void SqliteTransaction::Rollback() {
  if (depth_ == 0) {
    db_->Exec("ROLLBACK;");
  } else {
    // ROLLBACK TO keeps the savepoint open; RELEASE pops it
    db_->Exec("ROLLBACK TO " + Savepoint() + "; RELEASE " + Savepoint() + ";");
  }
  Finish();
}

} // namespace causal::db::sqlite
