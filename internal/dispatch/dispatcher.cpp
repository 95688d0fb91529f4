#include "dispatcher.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace causal::dispatch {

using causal::observability::IntField;
using causal::observability::StringField;
using causal::projection::ErrorKind;
using causal::projection::HandlerError;

namespace {

std::string ErrorName(const std::exception& e) {
  if (dynamic_cast<const util::ValidationError*>(&e)) return "ValidationError";
  if (dynamic_cast<const util::InvalidState*>(&e)) return "InvalidState";
  if (dynamic_cast<const util::NotFound*>(&e)) return "NotFound";
  if (dynamic_cast<const util::StorageError*>(&e)) return "StorageError";
  return "Error";
}

} // namespace

HandlerError Dispatcher::MakeError(const db::model::EventRecord& row, ErrorKind kind, const std::string& error,
                                   const std::string& reason) {
  HandlerError err;
  err.kind           = kind;
  err.error          = error;
  err.message        = row.actor + " at " + row.origin + " initiated " + row.command +
                       " that led to an error: " + reason;
  err.command        = row.command;
  err.payload        = row.payload;
  err.actor          = row.actor;
  err.origin         = row.origin;
  err.id             = row.id;
  err.version        = row.version;
  err.timestamp_ms   = row.timestamp_ms;
  err.correlation_id = row.correlation_id;
  err.causation_id   = row.causation_id;
  err.metadata       = row.metadata;
  return err;
}

void Dispatcher::Report(const HandlerError& error, const projection::Projection* projection,
                        const projection::Hooks& hooks) {
  CAUSAL_LOG_WARN("dispatch failed", {StringField("command", error.command), IntField("id", error.id),
                                      StringField("kind", projection::ErrorKindName(error.kind)),
                                      StringField("error", error.message)});
  try {
    hooks.NotifyError(error);
  } catch (const std::exception& e) {
    CAUSAL_LOG_ERROR("error hook failed", {StringField("command", error.command), StringField("error", e.what())});
  }

  if (!projection) return;
  try {
    projection->NotifyError(error);
  } catch (const std::exception& e) {
    CAUSAL_LOG_ERROR("projection error hook failed",
                     {StringField("command", error.command), StringField("error", e.what())});
  }
}

// ------------------------------------------------------------
// Execute
// ------------------------------------------------------------

DispatchResult Dispatcher::Execute(const db::model::EventRecord& row, const projection::Projection& projection,
                                   const projection::Hooks& hooks) {
  ErrorKind stage = ErrorKind::kMigration;

  try {
    const auto payload = projection.ApplyMigrations(row.command, row.version, row.payload);

    stage = ErrorKind::kHandler;
    google::protobuf::Value result;
    if (const auto* handler = projection.FindHandler(row.command)) {
      result = (*handler)(payload, projection::EventMeta::FromRecord(row));
    } else if (const auto* query = projection.FindQuery(row.command)) {
      result = (*query)(payload);
    } else {
      result = projection.Default()(payload, projection::EventMeta::FromRecord(row));
    }

    stage = ErrorKind::kHook;
    if (const auto* cb = hooks.Find(row.command)) {
      (*cb)(result, row);
    }
    projection.NotifyDone(row, result);

    return DispatchResult::Ok(row, std::move(result));
  } catch (const std::exception& e) {
    auto err = MakeError(row, stage, ErrorName(e), e.what());
    Report(err, &projection, hooks);
    return DispatchResult::Err(std::move(err), row);
  } catch (...) {
    auto err = MakeError(row, stage, "Error", "non-standard exception");
    Report(err, &projection, hooks);
    return DispatchResult::Err(std::move(err), row);
  }
}

} // namespace causal::dispatch
