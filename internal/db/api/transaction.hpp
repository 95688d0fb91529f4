#pragma once

namespace causal::db {

/*
  Unit of work over the event log.

  Write transactions (EventRepository::Begin) serialize appends so ids
  are handed out in commit order; an uncommitted insert never becomes
  visible and its id is not observable by other readers.

  Read transactions (EventRepository::BeginRead) see one consistent
  snapshot of the log for every query issued through them.

  Dropping a transaction without Commit() rolls it back.
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
