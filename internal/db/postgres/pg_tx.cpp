#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace apparatus::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) : connection_(pool->Acquire()) {
  work_ = std::make_unique<pqxx::work>(*connection_);
}

PgTransaction::~PgTransaction() {
  if (!finished_) {
    try {
      work_->abort();
    } catch (const std::exception& ex) {
      APPARATUS_LOG_WARN("postgres rollback failed", {observability::StringField("error", ex.what())});
    }
  }
  work_.reset();
}

void PgTransaction::Commit() {
  try {
    work_->commit();
  } catch (const pqxx::serialization_failure& ex) {
    finished_ = true;
    throw util::ConflictError(std::string("postgres commit: ") + ex.what());
  } catch (const pqxx::unique_violation& ex) {
    // a deferred uniqueness check lost to a concurrent build
    finished_ = true;
    throw util::ConflictError(std::string("postgres commit: ") + ex.what());
  }
  finished_ = true;
}

void PgTransaction::Rollback() {
  if (finished_) {
    return;
  }
  work_->abort();
  finished_ = true;
}

} // namespace apparatus::db::postgres
