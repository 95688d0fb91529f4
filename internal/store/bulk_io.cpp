#include "bulk_io.hpp"

#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace causal::store {

using causal::observability::IntField;
using google::protobuf::Value;

namespace {

Value Str(const std::string& s) {
  Value v;
  v.set_string_value(s);
  return v;
}

Value Num(double n) {
  Value v;
  v.set_number_value(n);
  return v;
}

Value Null() {
  Value v;
  v.set_null_value(google::protobuf::NULL_VALUE);
  return v;
}

Value ExportLine(const db::model::EventRecord& e, bool include_metadata) {
  Value line   = util::EmptyStruct();
  auto& fields = *line.mutable_struct_value()->mutable_fields();
  fields["id"]             = Num(static_cast<double>(e.id));
  fields["version"]        = Num(e.version);
  fields["timestamp_ms"]   = Num(static_cast<double>(e.timestamp_ms));
  fields["actor"]          = Str(e.actor);
  fields["origin"]         = Str(e.origin);
  fields["command"]        = Str(e.command);
  fields["payload"]        = e.payload;
  fields["correlation_id"] = e.correlation_id ? Str(*e.correlation_id) : Null();
  fields["causation_id"]   = e.causation_id ? Num(static_cast<double>(*e.causation_id)) : Null();
  if (include_metadata) fields["metadata"] = e.metadata;
  return line;
}

std::string CsvField(const std::string& field) {
  if (field.find_first_of(",\"\n") == std::string::npos) return field;
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') out += '"';
    out += c;
  }
  return out + "\"";
}

bool IsBlank(const std::string& line) {
  return line.find_first_not_of(" \t\r") == std::string::npos;
}

const Value* Field(const Value& line, const char* key) {
  const auto& fields = line.struct_value().fields();
  auto        it     = fields.find(key);
  if (it == fields.end() || it->second.has_null_value()) return nullptr;
  return &it->second;
}

struct ParsedLine {
  std::optional<int64_t> exported_id;
  StoreRequest           request;
};

// Throws on malformed or (when validating) incomplete lines.
ParsedLine ParseLine(const std::string& text, bool validate) {
  const auto line = util::FromJson(text);
  if (!line.has_struct_value()) throw util::ValidationError("line is not a JSON object");

  ParsedLine parsed;
  auto&      r = parsed.request;
  if (auto* v = Field(line, "id")) parsed.exported_id = static_cast<int64_t>(v->number_value());
  if (auto* v = Field(line, "command")) r.command = v->string_value();
  if (auto* v = Field(line, "actor")) r.actor = v->string_value();
  if (auto* v = Field(line, "origin")) r.origin = v->string_value();
  if (auto* v = Field(line, "version")) r.version = static_cast<int32_t>(v->number_value());
  if (auto* v = Field(line, "timestamp_ms")) r.timestamp_ms = static_cast<uint64_t>(v->number_value());
  if (auto* v = Field(line, "correlation_id")) r.correlation_id = v->string_value();
  if (auto* v = Field(line, "causation_id")) r.causation_id = static_cast<int64_t>(v->number_value());
  if (auto* v = Field(line, "payload")) r.payload = *v;
  if (auto* v = Field(line, "metadata")) r.metadata = *v;

  if (validate) {
    if (r.command.empty()) throw util::ValidationError("missing required field: command");
    if (r.payload.kind_case() != Value::KIND_NOT_SET && !r.payload.has_struct_value()) {
      throw util::ValidationError("invalid payload: must be an object");
    }
    if (r.metadata.kind_case() != Value::KIND_NOT_SET && !r.metadata.has_struct_value()) {
      throw util::ValidationError("invalid metadata: must be an object");
    }
  }
  return parsed;
}

void RecordError(std::vector<BulkError>& errors, uint64_t line, std::string message) {
  if (errors.size() < ImportReport::kMaxErrors) errors.push_back(BulkError{line, std::move(message)});
}

} // namespace

// ------------------------------------------------------------
// Export
// ------------------------------------------------------------

uint64_t ExportJsonl(const EventStore& store, std::ostream& out, const ExportOptions& options) {
  uint64_t exported = 0;
  auto     stream   = store.StreamEvents(options.stream);
  while (auto batch = stream.Next()) {
    for (const auto& e : *batch) {
      out << util::ToJson(ExportLine(e, options.include_metadata)) << '\n';
      exported++;
    }
  }
  out.flush();
  if (!out) throw util::StorageError("export: write failed after " + std::to_string(exported) + " events");
  return exported;
}

uint64_t ExportCsv(const EventStore& store, std::ostream& out, const ExportOptions& options) {
  if (options.include_headers) {
    out << "id,version,timestamp_ms,actor,origin,command,payload,correlation_id,causation_id";
    if (options.include_metadata) out << ",metadata";
    out << '\n';
  }

  uint64_t exported = 0;
  auto     stream   = store.StreamEvents(options.stream);
  while (auto batch = stream.Next()) {
    for (const auto& e : *batch) {
      out << e.id << ',' << e.version << ',' << e.timestamp_ms << ',' << CsvField(e.actor) << ','
          << CsvField(e.origin) << ',' << CsvField(e.command) << ',' << CsvField(util::ToJson(e.payload)) << ','
          << CsvField(e.correlation_id.value_or("")) << ',';
      if (e.causation_id) out << *e.causation_id;
      if (options.include_metadata) out << ',' << CsvField(util::ToJson(e.metadata));
      out << '\n';
      exported++;
    }
  }
  out.flush();
  if (!out) throw util::StorageError("export: write failed after " + std::to_string(exported) + " events");
  return exported;
}

// ------------------------------------------------------------
// Import
// ------------------------------------------------------------

ImportReport ImportJsonl(EventStore& store, std::istream& in, const projection::Projection& projection,
                         const projection::Hooks& hooks, const ImportOptions& options) {
  if (options.batch_size == 0) throw util::ValidationError("import: batch_size must be positive");

  ImportReport report;

  std::vector<StoreRequest>           pending;
  std::vector<std::optional<int64_t>> pending_ids;
  std::set<int64_t>                   pending_lookup;

  auto flush = [&] {
    if (pending.empty()) return;
    try {
      auto entries = store.StoreBulk(pending, projection, hooks);
      for (size_t i = 0; i < entries.size(); ++i) {
        if (pending_ids[i]) report.id_map[*pending_ids[i]] = entries[i].row.id;
      }
      report.imported += entries.size();
    } catch (const util::BulkAbort& e) {
      if (!options.skip_errors) throw;
      report.failed += pending.size();
      RecordError(report.errors, 0, e.what());
    }
    pending.clear();
    pending_ids.clear();
    pending_lookup.clear();
  };

  std::string text;
  uint64_t    line_no = 0;
  while (std::getline(in, text)) {
    line_no++;
    if (IsBlank(text)) continue;

    ParsedLine parsed;
    try {
      parsed = ParseLine(text, options.validate);
    } catch (const std::exception& e) {
      if (!options.skip_errors) {
        throw util::ValidationError("import line " + std::to_string(line_no) + ": " + e.what());
      }
      report.failed++;
      RecordError(report.errors, line_no, e.what());
      continue;
    }

    auto& request = parsed.request;
    if (request.causation_id) {
      // parent still waiting in this batch: store it first so its new id is known
      if (pending_lookup.count(*request.causation_id)) flush();
      if (auto it = report.id_map.find(*request.causation_id); it != report.id_map.end()) {
        request.causation_id = it->second;
      }
    }

    if (parsed.exported_id) pending_lookup.insert(*parsed.exported_id);
    pending_ids.push_back(parsed.exported_id);
    pending.push_back(std::move(request));
    if (pending.size() >= options.batch_size) flush();
  }
  flush();

  CAUSAL_LOG_INFO("jsonl import finished", {IntField("imported", static_cast<int64_t>(report.imported)),
                                            IntField("failed", static_cast<int64_t>(report.failed))});
  return report;
}

// ------------------------------------------------------------
// Batch processing / stats
// ------------------------------------------------------------

BatchReport BatchProcess(const EventStore& store,
                         const std::function<void(const std::vector<db::model::EventRecord>&)>& fn,
                         StreamOptions options) {
  BatchReport report;
  auto        stream = store.StreamEvents(std::move(options));
  while (auto batch = stream.Next()) {
    try {
      fn(*batch);
      report.processed += batch->size();
    } catch (const std::exception& e) {
      report.failed += batch->size();
      RecordError(report.errors, 0, e.what());
      CAUSAL_LOG_WARN("batch processor failed", {IntField("first_id", batch->front().id),
                                                 IntField("events", static_cast<int64_t>(batch->size()))});
    }
  }
  return report;
}

ProcessingStats GetProcessingStats(const EventStore& store, StreamOptions options) {
  ProcessingStats       stats;
  std::set<std::string> correlations;

  auto stream = store.StreamEvents(std::move(options));
  while (auto batch = stream.Next()) {
    for (const auto& e : *batch) {
      stats.total++;
      stats.by_command[e.command]++;
      if (!e.actor.empty()) stats.by_actor[e.actor]++;
      stats.by_version[e.version]++;

      if (!stats.min_timestamp_ms || e.timestamp_ms < *stats.min_timestamp_ms) stats.min_timestamp_ms = e.timestamp_ms;
      if (!stats.max_timestamp_ms || e.timestamp_ms > *stats.max_timestamp_ms) stats.max_timestamp_ms = e.timestamp_ms;

      if (e.correlation_id) correlations.insert(*e.correlation_id);
      if (e.causation_id) {
        stats.children++;
      } else {
        stats.roots++;
      }
    }
  }
  stats.unique_correlations = correlations.size();
  return stats;
}

} // namespace causal::store
