#pragma once

namespace freightline::db {

/*
  Unit of work over the tokens table.

  Reads inside the transaction see its own writes. Nothing is visible to
  other transactions before Commit(). The destructor rolls back anything
  not committed. Commit()/Rollback() throw db::TransactionError.
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit()            = 0;
  virtual void Rollback()          = 0;
  virtual bool IsCommitted() const = 0;
};

} // namespace freightline::db
