#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/store/store_types.hpp"

namespace causal::store {

/*
  Pull-based cursor over the log in ascending id order.

  Each Next() reads one batch in its own read transaction, so the
  stream may be consumed while other writers append. Cursor() is the
  next start id; a new stream opened at Cursor() resumes where this
  one stopped.
*/

class EventStream {
 public:
  EventStream(std::shared_ptr<db::EventRepository> repository, StreamOptions options);

  // next non-empty batch, nullopt once exhausted
  std::optional<std::vector<db::model::EventRecord>> Next();

  int64_t Cursor() const {
    return cursor_;
  }

  bool Done() const {
    return done_;
  }

 private:
  db::EventFilter Filter() const;

  std::shared_ptr<db::EventRepository> repository_;
  StreamOptions                        options_;
  int64_t                              cursor_;
  bool                                 done_ = false;
};

} // namespace causal::store
