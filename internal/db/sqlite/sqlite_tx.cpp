#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace apparatus::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, SqliteTxMode mode, DeletedUnitsHook on_units_deleted)
    : db_(std::move(db)), mode_(mode), on_units_deleted_(std::move(on_units_deleted)), lock_(db_->LockForTransaction()) {
  try {
    db_->Exec(mode_ == SqliteTxMode::kBuild ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
  } catch (const std::exception&) {
    db_->UnlockTransaction(lock_);
    throw;
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& ex) {
      APPARATUS_LOG_WARN("sqlite rollback failed", {observability::StringField("error", ex.what())});
    }
  }
  db_->UnlockTransaction(lock_);
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
  db_->UnlockTransaction(lock_);

  // after unlocking: the hook opens a transaction on another connection
  if (!deleted_units_.empty() && on_units_deleted_) {
    on_units_deleted_(deleted_units_);
  }
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
  deleted_units_.clear();
  db_->UnlockTransaction(lock_);
}

} // namespace apparatus::db::sqlite
