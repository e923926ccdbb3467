#include "sqlite_db.hpp"

#include <stdexcept>

namespace apparatus::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, uint32_t busy_timeout_ms) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure(busy_timeout_ms);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

void SqliteDB::Configure(uint32_t busy_timeout_ms) {
  // readers on other connections never wait for the writer
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite; cascades depend on them
  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks held by other processes instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_ms)), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

void SqliteDB::Attach(const std::string& path, const std::string& schema) {
  const std::string sql = "ATTACH DATABASE ? AS " + schema + ";";
  sqlite3_stmt*     st  = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, sql.c_str(), -1, &st, nullptr), db_, "attach");
  sqlite3_bind_text(st, 1, path.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(st);
  sqlite3_finalize(st);
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("attach " + path + ": " + sqlite3_errmsg(db_));
  }

  Exec("PRAGMA " + schema + ".journal_mode=WAL;");
  Exec("PRAGMA " + schema + ".synchronous=NORMAL;");
}

std::unique_lock<std::mutex> SqliteDB::LockForTransaction() {
  if (tx_owner_.load() == std::this_thread::get_id()) {
    throw std::runtime_error("sqlite: a transaction is already open on this connection in the current thread");
  }
  std::unique_lock lock(tx_mutex_);
  tx_owner_.store(std::this_thread::get_id());
  return lock;
}

void SqliteDB::UnlockTransaction(std::unique_lock<std::mutex>& lock) {
  if (!lock.owns_lock()) return;
  tx_owner_.store(std::thread::id{});
  lock.unlock();
}

} // namespace apparatus::db::sqlite
