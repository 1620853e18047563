#pragma once

namespace gearledger::db {

// kWrite takes the database write lock up front (BEGIN IMMEDIATE) so the
// find-then-merge sequence of an upsert cannot interleave with another
// writer. kRead starts a deferred snapshot.
enum class TxMode {
  kRead,
  kWrite,
};

/*
  One ledger transaction on a connection owned by the calling worker.

  Writes become visible to other workers at Commit(). Destroying an
  uncommitted transaction rolls it back.
*/
class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
