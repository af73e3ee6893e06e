#pragma once

namespace vts {

class SqliteConnection;

/*
  Scoped write transaction.

  - BEGIN IMMEDIATE on construction
  - changes are invisible to other connections until commit()
  - destructor rolls back if neither commit() nor rollback() ran
*/
class Transaction {
public:
  explicit Transaction(SqliteConnection& conn);
  ~Transaction();

  Transaction(const Transaction&) = delete;
  Transaction& operator=(const Transaction&) = delete;

  void commit();
  void rollback();

  bool active() const { return active_; }

private:
  SqliteConnection& conn_;
  bool active_;
};

} // namespace vts
