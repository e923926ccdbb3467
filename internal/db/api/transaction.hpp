#pragma once

namespace apparatus::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws util::ConflictError when a unit claimed in this
    transaction was changed by another committed transaction

  SQLite: BEGIN IMMEDIATE, serialized per connection
  Postgres: pqxx::work
  Memory: snapshot copy + per-unit version check on commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;
};

} // namespace apparatus::db
