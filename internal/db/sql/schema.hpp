#pragma once

#include <string>
#include <vector>

namespace causal::runtime::config {
class IndexConfig;
}

namespace causal::db::sql {

/*
  Which secondary indices to build.

  correlation_id / causation_id back every lineage query; turning them
  off only trades read speed for write speed.
*/
struct IndexOptions {
  bool correlation_id      = true;
  bool causation_id        = true;
  bool command             = false;
  bool actor               = false;
  bool timestamp           = false;
  bool version             = false;
  bool correlation_command = false;
  bool actor_timestamp     = false;

  static IndexOptions FromConfig(const causal::runtime::config::IndexConfig& config);
};

// CREATE TABLE followed by the enabled CREATE INDEX statements.
std::vector<std::string> BootstrapStatements(const IndexOptions& options);

} // namespace causal::db::sql
