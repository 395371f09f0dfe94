#pragma once

namespace transcription::db {

/*
  One unit of work against the job/asset store.

  A submission reads the live job for a key and inserts a new one in the same
  transaction, so both backends serialize writers: SQLite through
  BEGIN IMMEDIATE, the memory backend by holding its state lock. Nothing is
  visible to other transactions before Commit(), and a transaction destroyed
  while still open rolls back.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  // false once Commit() or Rollback() has run
  virtual bool IsOpen() const = 0;
};

} // namespace transcription::db
