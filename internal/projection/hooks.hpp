#pragma once

#include <google/protobuf/struct.pb.h>

#include <functional>
#include <map>
#include <string>

#include "internal/db/model/event_record.hpp"
#include "internal/projection/handler_error.hpp"

namespace causal::projection {

/*
  Caller-side notification callbacks.

  Per-command callback, else the default one, after a successful
  dispatch. The error callback receives every HandlerError.
*/

class Hooks {
 public:
  using Callback      = std::function<void(const google::protobuf::Value&, const db::model::EventRecord&)>;
  using ErrorCallback = std::function<void(const HandlerError&)>;

  Hooks& On(const std::string& command, Callback cb) {
    callbacks_[command] = std::move(cb);
    return *this;
  }

  Hooks& SetDefault(Callback cb) {
    default_ = std::move(cb);
    return *this;
  }

  Hooks& OnError(ErrorCallback cb) {
    error_ = std::move(cb);
    return *this;
  }

  // command callback, else default; nullptr if neither is set
  const Callback* Find(const std::string& command) const {
    if (auto it = callbacks_.find(command); it != callbacks_.end()) return &it->second;
    return default_ ? &default_ : nullptr;
  }

  void NotifyError(const HandlerError& error) const {
    if (error_) error_(error);
  }

  // no-op callbacks
  static const Hooks& Void() {
    static const Hooks hooks;
    return hooks;
  }

 private:
  std::map<std::string, Callback> callbacks_;
  Callback                        default_;
  ErrorCallback                   error_;
};

} // namespace causal::projection
