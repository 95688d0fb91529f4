#pragma once

#include <google/protobuf/struct.pb.h>

#include <optional>
#include <variant>

#include "internal/db/model/event_record.hpp"
#include "internal/projection/handler_error.hpp"

namespace causal::dispatch {

/*
  Outcome of one dispatch: Ok(value) or Err(error).

  row is the persisted event; it is also set on Err when the failure
  happened after persistence (handler, migration or hook errors).
*/

class DispatchResult {
 public:
  static DispatchResult Ok(db::model::EventRecord row, google::protobuf::Value value) {
    return DispatchResult(std::move(value), std::move(row));
  }

  static DispatchResult Err(projection::HandlerError error, std::optional<db::model::EventRecord> row = std::nullopt) {
    return DispatchResult(std::move(error), std::move(row));
  }

  bool IsOk() const {
    return std::holds_alternative<google::protobuf::Value>(outcome_);
  }

  explicit operator bool() const {
    return IsOk();
  }

  // Throws std::bad_variant_access on the wrong alternative.
  const google::protobuf::Value& Value() const {
    return std::get<google::protobuf::Value>(outcome_);
  }

  const projection::HandlerError& Error() const {
    return std::get<projection::HandlerError>(outcome_);
  }

  const std::optional<db::model::EventRecord>& Row() const {
    return row_;
  }

 private:
  DispatchResult(google::protobuf::Value value, std::optional<db::model::EventRecord> row)
      : outcome_(std::move(value)), row_(std::move(row)) {
  }

  DispatchResult(projection::HandlerError error, std::optional<db::model::EventRecord> row)
      : outcome_(std::move(error)), row_(std::move(row)) {
  }

  std::variant<google::protobuf::Value, projection::HandlerError> outcome_;
  std::optional<db::model::EventRecord>                           row_;
};

} // namespace causal::dispatch
