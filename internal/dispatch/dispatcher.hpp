#pragma once

#include "internal/dispatch/dispatch_result.hpp"
#include "internal/projection/hooks.hpp"
#include "internal/projection/projection.hpp"

namespace causal::dispatch {

/*
  Routes one persisted row to its projection handler.

  Never throws: any failure in migration, handler or success hook is
  turned into a HandlerError, sent to hooks.error and projection.error,
  and returned as Err.
*/

class Dispatcher {
 public:
  static DispatchResult Execute(const db::model::EventRecord& row, const projection::Projection& projection,
                                const projection::Hooks& hooks);

  // HandlerError carrying the row's full context.
  static projection::HandlerError MakeError(const db::model::EventRecord& row, projection::ErrorKind kind,
                                            const std::string& error, const std::string& reason);

  // Delivers to both error sinks. A failing sink is logged, never rethrown.
  static void Report(const projection::HandlerError& error, const projection::Projection* projection,
                     const projection::Hooks& hooks);
};

} // namespace causal::dispatch
