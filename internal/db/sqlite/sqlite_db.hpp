#pragma once

#include <sqlite3.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/db/sql/migrations.hpp"

namespace apparatus::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection, always in WAL mode.

  The connection carries at most one open transaction. Transactions from
  other threads queue on tx_mutex_; a second Begin() on the owning thread
  fails fast instead of deadlocking.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  explicit SqliteDB(std::string path, uint32_t busy_timeout_ms = 5000);
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

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // ATTACH another database file under `schema`, also in WAL mode.
  void Attach(const std::string& path, const std::string& schema);

  std::unique_lock<std::mutex> LockForTransaction();
  void                         UnlockTransaction(std::unique_lock<std::mutex>& lock);

 private:
  void Configure(uint32_t busy_timeout_ms);

  sqlite3*    db_ = nullptr;
  std::string path_;

  std::mutex                   tx_mutex_;
  std::atomic<std::thread::id> tx_owner_{};
};

} // namespace apparatus::db::sqlite
