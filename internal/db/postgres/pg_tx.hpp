#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace apparatus::db::postgres {

/*
  Postgres transaction.

  Borrows one pooled connection for its lifetime; the connection goes
  back to the pool only after the pqxx::work is closed. Unit claims are
  enforced by the version predicate in claim_unit, so READ COMMITTED is
  enough here.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  pqxx::work& Work() { return *work_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return finished_; }

private:
  std::shared_ptr<pqxx::connection> connection_;
  std::unique_ptr<pqxx::work>       work_;
  bool                              finished_ = false;
};

} // namespace apparatus::db::postgres
