#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/lineage/lineage_engine.hpp"
#include "internal/store/event_store.hpp"

namespace causal::factory {

/*
  Runtime

  Owns the long-lived components of one embedded store. The store and
  the lineage engine share the repository.
*/
struct Runtime {
  std::shared_ptr<db::EventRepository> repository;

  std::shared_ptr<store::EventStore>           store;
  std::shared_ptr<lineage::LineageQueryEngine> lineage;
};

/*
  Build

  Constructs the backend, schema, cache, store and query engine from
  runtime config.

  NOTE:
  This is the composition root. It is the ONLY place allowed to know
  concrete DB types.
*/
Runtime Build(const causal::runtime::config::RuntimeConfig& config);

} // namespace causal::factory
