#pragma once

#include <google/protobuf/struct.pb.h>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include "internal/db/model/event_record.hpp"
#include "internal/projection/handler_error.hpp"

namespace causal::projection {

// Row context handed to handlers alongside the (migrated) payload.
struct EventMeta {
  int64_t     id      = 0;
  int32_t     version = 1;
  uint64_t    timestamp_ms = 0;
  std::string actor;
  std::string origin;
  std::string command;

  std::optional<std::string> correlation_id;
  std::optional<int64_t>     causation_id;
  google::protobuf::Value    metadata;

  static EventMeta FromRecord(const db::model::EventRecord& row);
};

/*
  Read-model handler registry.

  Resolution order used by the dispatcher:
    1. command handler
    2. named query (read-only, payload only)
    3. default handler (mandatory, supplied at construction)

  Migrations are per command: transformer i upgrades version i+1 to i+2.
*/

class Projection {
 public:
  using Handler      = std::function<google::protobuf::Value(const google::protobuf::Value&, const EventMeta&)>;
  using QueryHandler = std::function<google::protobuf::Value(const google::protobuf::Value&)>;
  using Migration    = std::function<google::protobuf::Value(const google::protobuf::Value&)>;
  using DoneFn       = std::function<void(const db::model::EventRecord&, const google::protobuf::Value&)>;
  using ErrorFn      = std::function<void(const HandlerError&)>;

  explicit Projection(Handler default_handler);

  Projection& On(const std::string& command, Handler handler);
  Projection& OnQuery(const std::string& name, QueryHandler handler);
  Projection& OnDone(DoneFn fn);
  Projection& OnError(ErrorFn fn);
  Projection& AddMigration(const std::string& command, Migration migration);

  const Handler*      FindHandler(const std::string& command) const;
  const QueryHandler* FindQuery(const std::string& name) const;
  const Handler&      Default() const {
    return default_;
  }

  // Applies transformers [version-1, N) in order. Versions <= 0 are treated as 1.
  google::protobuf::Value ApplyMigrations(const std::string& command, int32_t version,
                                          const google::protobuf::Value& payload) const;

  size_t MigrationCount(const std::string& command) const;

  void NotifyDone(const db::model::EventRecord& row, const google::protobuf::Value& result) const;
  void NotifyError(const HandlerError& error) const;

 private:
  Handler                                         default_;
  std::map<std::string, Handler>                  handlers_;
  std::map<std::string, QueryHandler>             queries_;
  std::map<std::string, std::vector<Migration>>   migrations_;
  DoneFn                                          done_;
  ErrorFn                                         error_;
};

} // namespace causal::projection
