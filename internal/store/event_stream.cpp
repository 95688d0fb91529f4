#include "event_stream.hpp"

#include "internal/util/errors.hpp"

namespace causal::store {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // namespace

EventStream::EventStream(std::shared_ptr<db::EventRepository> repository, StreamOptions options)
    : repository_(std::move(repository)), options_(std::move(options)), cursor_(options_.start_id) {
  if (options_.batch_size == 0) {
    throw util::ValidationError("stream events: batch_size must be positive");
  }
  if (options_.end_id && *options_.end_id < cursor_) done_ = true;
}

db::EventFilter EventStream::Filter() const {
  db::EventFilter filter;
  std::visit(Overloaded{
                 [](std::monostate) {},
                 [&](const ByCorrelation& f) { filter.correlation_id = f.correlation_id; },
                 [&](const ByActor& f) { filter.actor = f.actor; },
                 [&](const ByCommand& f) { filter.command = f.command; },
             },
             options_.filter);
  filter.min_id = cursor_;
  filter.max_id = options_.end_id;
  return filter;
}

std::optional<std::vector<db::model::EventRecord>> EventStream::Next() {
  if (done_) return std::nullopt;

  db::Pagination page;
  page.limit = options_.batch_size;

  auto tx    = repository_->BeginRead();
  auto batch = repository_->ListEvents(*tx, Filter(), db::EventOrder::kIdAscending, page);
  tx->Commit();

  if (batch.empty()) {
    done_ = true;
    return std::nullopt;
  }

  cursor_ = batch.back().id + 1;
  if (options_.end_id && cursor_ > *options_.end_id) done_ = true;

  return batch;
}

} // namespace causal::store
