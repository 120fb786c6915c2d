#pragma once

#include "internal/db/api/result.hpp"

namespace dispatcher::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Commit() is all-or-nothing; a failed commit leaves nothing behind
    and reports Conflict/Busy/SerializationFailure when a concurrent
    writer won
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE
  Postgres: pqxx::work
  Memory: write set validated per row at commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual Result Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has finished the transaction
  virtual bool IsFinished() const = 0;
};

} // namespace dispatcher::db
