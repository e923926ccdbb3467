#pragma once

#include <set>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace apparatus::db::memory {

/*
  Transaction = snapshot + write set

  Commit only publishes the units and acknowledgements this transaction
  wrote. Every written unit is fenced on the version it had in the
  snapshot, so two transactions on different Locations commit
  independently while two on the same Location conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_ || rolled_back_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

  // Write-set tracking, called by the repository before each mutation.
  void TouchUnit(uint64_t unit_id);
  void CreatedUnit(uint64_t unit_id);
  void ClaimedUnit(uint64_t unit_id);
  void DeletedUnit(uint64_t unit_id);
  void TouchAcknowledgement(const MemoryRepository::AckKey& key);

 private:
  struct Fence {
    uint64_t base_version = 0;
    bool     created      = false;
    bool     claimed      = false;
  };

  void CheckFences() const;

  MemoryRepository&                     repo_;
  MemoryRepository::State               working_;
  std::map<uint64_t, Fence>             fences_;
  std::set<uint64_t>                    deleted_;
  std::set<MemoryRepository::AckKey>    dirty_acks_;
  bool                                  committed_   = false;
  bool                                  rolled_back_ = false;
};

} // namespace apparatus::db::memory
