#include "internal/db/sql/schema.hpp"

#include "config/config.pb.h"
#include "internal/db/sql/sql_queries.hpp"

namespace causal::db::sql {

IndexOptions IndexOptions::FromConfig(const causal::runtime::config::IndexConfig& config) {
  IndexOptions options;
  options.correlation_id      = config.correlation_id();
  options.causation_id        = config.causation_id();
  options.command             = config.command();
  options.actor               = config.actor();
  options.timestamp           = config.timestamp();
  options.version             = config.version();
  options.correlation_command = config.correlation_command();
  options.actor_timestamp     = config.actor_timestamp();
  return options;
}

std::vector<std::string> BootstrapStatements(const IndexOptions& options) {
  std::vector<std::string> out{CREATE_EVENTS};

  if (options.correlation_id) out.emplace_back(INDEX_CORRELATION_ID);
  if (options.causation_id) out.emplace_back(INDEX_CAUSATION_ID);
  if (options.command) out.emplace_back(INDEX_COMMAND);
  if (options.actor) out.emplace_back(INDEX_ACTOR);
  if (options.timestamp) out.emplace_back(INDEX_TIMESTAMP);
  if (options.version) out.emplace_back(INDEX_VERSION);
  if (options.correlation_command) out.emplace_back(INDEX_CORRELATION_COMMAND);
  if (options.actor_timestamp) out.emplace_back(INDEX_ACTOR_TIMESTAMP);

  return out;
}

} // namespace causal::db::sql
