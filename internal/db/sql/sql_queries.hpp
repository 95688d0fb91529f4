#pragma once

namespace causal::db::sql {

/*
  Canonical SQL for the event log.

  IMPORTANT:
  Column order in EVENT_COLUMNS is the order every backend reads rows in.
*/

static constexpr const char* CREATE_EVENTS =
    "CREATE TABLE IF NOT EXISTS events ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " version INTEGER DEFAULT 1,"
    " timestamp INTEGER NOT NULL,"
    " actor TEXT,"
    " origin TEXT,"
    " command TEXT NOT NULL,"
    " payload TEXT,"
    " correlation_id TEXT,"
    " causation_id INTEGER,"
    " metadata TEXT);";

static constexpr const char* DROP_EVENTS = "DROP TABLE IF EXISTS events;";

// AUTOINCREMENT keeps its high-water mark here; clear it so a reset restarts at 1.
static constexpr const char* RESET_SEQUENCE = "DELETE FROM sqlite_sequence WHERE name='events';";

static constexpr const char* EVENT_COLUMNS =
    "id,version,timestamp,actor,origin,command,payload,correlation_id,causation_id,metadata";

static constexpr const char* INSERT_EVENT =
    "INSERT INTO events(version,timestamp,actor,origin,command,payload,correlation_id,causation_id,metadata)"
    " VALUES(?,?,?,?,?,?,?,?,?)"
    " RETURNING id,version,timestamp,actor,origin,command,payload,correlation_id,causation_id,metadata;";

static constexpr const char* SELECT_EVENT =
    "SELECT id,version,timestamp,actor,origin,command,payload,correlation_id,causation_id,metadata"
    " FROM events WHERE id=?;";

static constexpr const char* SELECT_LAST_EVENT =
    "SELECT id,version,timestamp,actor,origin,command,payload,correlation_id,causation_id,metadata"
    " FROM events ORDER BY id DESC LIMIT 1;";

static constexpr const char* SELECT_ORPHANS =
    "SELECT id,version,timestamp,actor,origin,command,payload,correlation_id,causation_id,metadata"
    " FROM events WHERE causation_id IS NOT NULL"
    " AND causation_id NOT IN (SELECT id FROM events)"
    " ORDER BY id ASC;";

// secondary indices, each switchable from config

static constexpr const char* INDEX_CORRELATION_ID =
    "CREATE INDEX IF NOT EXISTS idx_correlation_id ON events(correlation_id);";

static constexpr const char* INDEX_CAUSATION_ID =
    "CREATE INDEX IF NOT EXISTS idx_causation_id ON events(causation_id);";

static constexpr const char* INDEX_COMMAND =
    "CREATE INDEX IF NOT EXISTS idx_command ON events(command);";

static constexpr const char* INDEX_ACTOR =
    "CREATE INDEX IF NOT EXISTS idx_actor ON events(actor);";

static constexpr const char* INDEX_TIMESTAMP =
    "CREATE INDEX IF NOT EXISTS idx_timestamp ON events(timestamp);";

static constexpr const char* INDEX_VERSION =
    "CREATE INDEX IF NOT EXISTS idx_version ON events(version);";

static constexpr const char* INDEX_CORRELATION_COMMAND =
    "CREATE INDEX IF NOT EXISTS idx_composite_correlation_command ON events(correlation_id, command);";

static constexpr const char* INDEX_ACTOR_TIMESTAMP =
    "CREATE INDEX IF NOT EXISTS idx_composite_actor_timestamp ON events(actor, timestamp);";

}
