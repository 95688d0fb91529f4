#include "projection.hpp"

#include "internal/util/errors.hpp"

namespace causal::projection {

const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidation:
      return "validation";
    case ErrorKind::kMigration:
      return "migration";
    case ErrorKind::kHandler:
      return "handler";
    case ErrorKind::kHook:
      return "hook";
  }
  return "unknown";
}

EventMeta EventMeta::FromRecord(const db::model::EventRecord& row) {
  EventMeta meta;
  meta.id             = row.id;
  meta.version        = row.version;
  meta.timestamp_ms   = row.timestamp_ms;
  meta.actor          = row.actor;
  meta.origin         = row.origin;
  meta.command        = row.command;
  meta.correlation_id = row.correlation_id;
  meta.causation_id   = row.causation_id;
  meta.metadata       = row.metadata;
  return meta;
}

Projection::Projection(Handler default_handler) : default_(std::move(default_handler)) {
  if (!default_) {
    throw util::ValidationError("projection requires a default handler");
  }
}

// ------------------------------------------------------------
// Registration
// ------------------------------------------------------------

Projection& Projection::On(const std::string& command, Handler handler) {
  handlers_[command] = std::move(handler);
  return *this;
}

Projection& Projection::OnQuery(const std::string& name, QueryHandler handler) {
  queries_[name] = std::move(handler);
  return *this;
}

Projection& Projection::OnDone(DoneFn fn) {
  done_ = std::move(fn);
  return *this;
}

Projection& Projection::OnError(ErrorFn fn) {
  error_ = std::move(fn);
  return *this;
}

Projection& Projection::AddMigration(const std::string& command, Migration migration) {
  migrations_[command].push_back(std::move(migration));
  return *this;
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

const Projection::Handler* Projection::FindHandler(const std::string& command) const {
  auto it = handlers_.find(command);
  return it == handlers_.end() ? nullptr : &it->second;
}

const Projection::QueryHandler* Projection::FindQuery(const std::string& name) const {
  auto it = queries_.find(name);
  return it == queries_.end() ? nullptr : &it->second;
}

size_t Projection::MigrationCount(const std::string& command) const {
  auto it = migrations_.find(command);
  return it == migrations_.end() ? 0 : it->second.size();
}

// ------------------------------------------------------------
// Migrations
// ------------------------------------------------------------

google::protobuf::Value Projection::ApplyMigrations(const std::string& command, int32_t version,
                                                    const google::protobuf::Value& payload) const {
  auto it = migrations_.find(command);
  if (it == migrations_.end()) return payload;

  const auto& chain = it->second;
  const auto  first = static_cast<size_t>(version > 1 ? version - 1 : 0);

  google::protobuf::Value current = payload;
  for (size_t i = first; i < chain.size(); ++i) {
    current = chain[i](current);
  }
  return current;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void Projection::NotifyDone(const db::model::EventRecord& row, const google::protobuf::Value& result) const {
  if (done_) done_(row, result);
}

void Projection::NotifyError(const HandlerError& error) const {
  if (error_) error_(error);
}

} // namespace causal::projection
