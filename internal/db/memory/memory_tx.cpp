#include "memory_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace apparatus::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::TouchUnit(uint64_t unit_id) {
  if (fences_.contains(unit_id)) return;
  auto it = working_.units.find(unit_id);
  fences_[unit_id] = Fence{.base_version = it == working_.units.end() ? 0 : it->second.unit.version};
}

void MemoryTransaction::CreatedUnit(uint64_t unit_id) {
  fences_[unit_id] = Fence{.base_version = 0, .created = true};
}

void MemoryTransaction::ClaimedUnit(uint64_t unit_id) {
  TouchUnit(unit_id);
  fences_[unit_id].claimed = true;
}

void MemoryTransaction::DeletedUnit(uint64_t unit_id) {
  TouchUnit(unit_id);
  deleted_.insert(unit_id);
}

void MemoryTransaction::TouchAcknowledgement(const MemoryRepository::AckKey& key) {
  dirty_acks_.insert(key);
}

// Caller holds repo_.mutex_.
void MemoryTransaction::CheckFences() const {
  const auto& committed = repo_.committed_;

  for (const auto& [unit_id, fence] : fences_) {
    if (fence.created) {
      if (deleted_.contains(unit_id)) continue;
      const auto& unit = working_.units.at(unit_id).unit;
      if (committed.unit_index.contains({unit.verse_id, unit.position})) {
        throw util::ConflictError("transaction conflict: unit " + unit.verse_id + "@" + std::to_string(unit.position) +
                                  " was created by a concurrent transaction");
      }
      continue;
    }

    auto it = committed.units.find(unit_id);
    if (it == committed.units.end()) {
      throw util::ConflictError("transaction conflict: unit " + std::to_string(unit_id) + " was deleted by a concurrent transaction");
    }
    if (it->second.unit.version != fence.base_version) {
      throw util::ConflictError("transaction conflict: unit " + std::to_string(unit_id) + " was modified by a concurrent transaction");
    }
  }

  for (const auto& key : dirty_acks_) {
    if (deleted_.contains(key.first)) continue;
    auto fence = fences_.find(key.first);
    const bool created_here = fence != fences_.end() && fence->second.created;
    if (!created_here && !committed.units.contains(key.first)) {
      throw util::ConflictError("transaction conflict: acknowledged unit " + std::to_string(key.first) + " no longer exists");
    }
  }
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::runtime_error("memory transaction already finished");
  }

  std::scoped_lock lock(repo_.mutex_);
  CheckFences();

  auto& committed = repo_.committed_;

  for (const auto& [unit_id, fence] : fences_) {
    if (deleted_.contains(unit_id)) {
      auto it = committed.units.find(unit_id);
      if (it == committed.units.end()) continue;
      for (const auto& reading : it->second.readings) {
        committed.reading_to_unit.erase(reading.id);
      }
      committed.unit_index.erase({it->second.unit.verse_id, it->second.unit.position});
      std::erase_if(committed.acknowledgements, [unit_id](const auto& entry) { return entry.first.first == unit_id; });
      committed.units.erase(it);
      continue;
    }

    auto state = working_.units.at(unit_id);
    // Every write to an existing unit moves its version, claimed or not.
    if (!fence.created && !fence.claimed) {
      state.unit.version = fence.base_version + 1;
    }
    for (const auto& reading : state.readings) {
      committed.reading_to_unit[reading.id] = unit_id;
    }
    committed.unit_index[{state.unit.verse_id, state.unit.position}] = unit_id;
    committed.units[unit_id] = std::move(state);
  }

  for (const auto& key : dirty_acks_) {
    if (deleted_.contains(key.first)) continue;
    auto it = working_.acknowledgements.find(key);
    if (it != working_.acknowledgements.end()) {
      committed.acknowledgements[key] = it->second;
    }
  }

  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  fences_.clear();
  deleted_.clear();
  dirty_acks_.clear();
}

} // namespace apparatus::db::memory
