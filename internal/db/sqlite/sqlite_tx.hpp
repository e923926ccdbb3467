#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace apparatus::db::sqlite {

enum class SqliteTxMode {
  // unit, reading and support writes: BEGIN IMMEDIATE on the units file
  kBuild,
  // reads plus acknowledgement writes: BEGIN DEFERRED, write lock on the
  // gate file only
  kSession,
};

/*
  SQLite transaction wrapper.

  Holds its connection's transaction lock for its whole lifetime. Build
  transactions grab the write lock up front to avoid upgrade deadlocks.
  Units deleted by a build are handed to on_units_deleted once the commit
  has landed, so their acknowledgements can be dropped.
*/
class SqliteTransaction final : public db::Transaction {
public:
  using DeletedUnitsHook = std::function<void(const std::vector<uint64_t>&)>;

  SqliteTransaction(std::shared_ptr<SqliteDB> db, SqliteTxMode mode, DeletedUnitsHook on_units_deleted = {});
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }
  bool IsSession() const { return mode_ == SqliteTxMode::kSession; }

  void NoteDeletedUnit(uint64_t unit_id) { deleted_units_.push_back(unit_id); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  SqliteTxMode                 mode_;
  DeletedUnitsHook             on_units_deleted_;
  std::vector<uint64_t>        deleted_units_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
};

} // namespace apparatus::db::sqlite
