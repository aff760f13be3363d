#pragma once

namespace slideshow::db {

/*
  Unit of work against the project ledger.

  Every backend guarantees:

  - Writes are invisible to other transactions until Commit()
  - Rollback() discards all writes
  - Destroying an unfinished transaction rolls it back

  Isolation:

    Memory   one transaction per repository at a time, snapshot copy
    SQLite   one transaction per connection at a time, BEGIN IMMEDIATE
    Postgres connection per transaction, pqxx::work

  Begin() blocks while another transaction holds a serialized backend,
  so a thread must finish one transaction before beginning the next.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
