#pragma once

namespace vkyc::db {

/*
  Unit of work against the session store.

  Every session mutation (state change plus its link, verification or
  recording rows) runs in one transaction, so a reader never sees a session
  whose version moved without its side rows. A biometric batch is appended
  in one transaction as well: all events land or none do.

  Transactions are exclusive writers and must not nest on one thread. A
  transaction destroyed without Commit() rolls back.

  Memory: snapshot of the committed state, swapped in on commit.
  SQLite: BEGIN IMMEDIATE on the shared connection.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace vkyc::db
