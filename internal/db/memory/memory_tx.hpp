#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace transcription::db::memory {

/*
  Transaction = exclusive lock + working copy.

  The repository lock is held for the transaction's lifetime, which gives the
  same single-writer behavior as SQLite's BEGIN IMMEDIATE. Nested
  transactions on one thread deadlock.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsOpen() const override {
    return !finished_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryRepository::State      working_;
  bool                         finished_ = false;
};

} // namespace transcription::db::memory
