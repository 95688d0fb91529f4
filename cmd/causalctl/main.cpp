#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "cmd/causalctl/exit_codes.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/lineage/event_report.hpp"
#include "internal/observability/logging.hpp"
#include "internal/projection/hooks.hpp"
#include "internal/projection/projection.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

using causal::db::model::EventRecord;

static void Usage() {
  std::cout << "Usage:\n"
            << "  causalctl <config.yaml> roots\n"
            << "  causalctl <config.yaml> children <id>\n"
            << "  causalctl <config.yaml> descendants <id>\n"
            << "  causalctl <config.yaml> depth <id>\n"
            << "  causalctl <config.yaml> orphans\n"
            << "  causalctl <config.yaml> branches <correlation_id>\n"
            << "  causalctl <config.yaml> critical-path <correlation_id>\n"
            << "  causalctl <config.yaml> report <correlation_id> [text|json|markdown]\n"
            << "  causalctl <config.yaml> tree <correlation_id>\n"
            << "  causalctl <config.yaml> replay [start_id] [stop_id]\n"
            << "  causalctl <config.yaml> append <command> <json_payload> [causation_id]\n";
}

static int64_t ParseId(const std::string& s) {
  size_t  used = 0;
  int64_t id   = 0;
  try {
    id = std::stoll(s, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (used == 0 || used != s.size()) {
    throw causal::util::ValidationError("invalid event id: '" + s + "'");
  }
  return id;
}

static void PrintEvent(const EventRecord& e, std::optional<uint32_t> depth = std::nullopt) {
  std::cout << e.id;
  if (depth) std::cout << "\tdepth=" << *depth;
  std::cout << "\t" << e.command << "\tcorrelation=" << e.correlation_id.value_or("-") << "\tcausation=";
  if (e.causation_id)
    std::cout << *e.causation_id;
  else
    std::cout << "-";
  std::cout << "\t" << causal::util::ToJson(e.payload) << "\n";
}

static void PrintEvents(const std::vector<EventRecord>& events) {
  for (const auto& e : events) PrintEvent(e);
}

// Passthrough read model: every command returns its (migrated) payload.
static causal::projection::Projection EchoProjection() {
  return causal::projection::Projection(
      [](const google::protobuf::Value& payload, const causal::projection::EventMeta&) { return payload; });
}

static int Run(const causal::factory::Runtime& rt, const std::string& cmd, int argc, char** argv) {
  auto arg = [&](int i) -> std::string {
    if (i >= argc) throw causal::util::ValidationError(cmd + ": missing argument");
    return argv[i];
  };

  if (cmd == "roots") {
    PrintEvents(rt.lineage->GetRootEvents());
    return causal::cli::kExitOk;
  }

  if (cmd == "children") {
    PrintEvents(rt.lineage->GetDirectChildren(ParseId(arg(3))));
    return causal::cli::kExitOk;
  }

  if (cmd == "descendants") {
    for (const auto& d : rt.lineage->GetDescendantEvents(ParseId(arg(3)))) PrintEvent(d.event, d.depth);
    return causal::cli::kExitOk;
  }

  if (cmd == "depth") {
    const auto id = ParseId(arg(3));
    if (!rt.store->RetrieveById(id)) throw causal::util::NotFound("event " + std::to_string(id) + " not found");
    std::cout << rt.lineage->GetEventDepth(id) << "\n";
    return causal::cli::kExitOk;
  }

  if (cmd == "orphans") {
    PrintEvents(rt.lineage->FindOrphanedEvents());
    return causal::cli::kExitOk;
  }

  if (cmd == "branches") {
    for (const auto& b : rt.lineage->GetEventBranches(arg(3)))
      std::cout << b.root_id << "\t" << b.depth << "\t" << b.path << "\t" << b.event.command << "\n";
    return causal::cli::kExitOk;
  }

  if (cmd == "critical-path") {
    auto path = rt.lineage->GetCriticalPath(arg(3));
    if (!path) throw causal::util::NotFound("no root events for correlation " + arg(3));
    std::cout << path->path << "\t(" << path->Length() << " events)\n";
    return causal::cli::kExitOk;
  }

  if (cmd == "report") {
    causal::lineage::ReportOptions options;
    options.correlation_id = arg(3);
    const auto format      = causal::lineage::ParseReportFormat(argc > 4 ? argv[4] : "text");
    std::cout << causal::lineage::Render(rt.lineage->GenerateReport(options), format) << "\n";
    return causal::cli::kExitOk;
  }

  if (cmd == "tree") {
    std::cout << rt.lineage->GenerateEventTree(arg(3));
    return causal::cli::kExitOk;
  }

  if (cmd == "replay") {
    causal::store::ReplayRange range;
    if (argc > 3) range.start = ParseId(argv[3]);
    if (argc > 4) range.stop = ParseId(argv[4]);

    uint64_t failed     = 0;
    auto     projection = EchoProjection();
    projection.OnDone([](const EventRecord& row, const google::protobuf::Value&) { PrintEvent(row); });

    causal::projection::Hooks hooks;
    hooks.OnError([&](const causal::projection::HandlerError& err) {
      failed++;
      std::cerr << err.message << "\n";
    });

    rt.store->CycleThrough(projection, [] { std::cerr << "replay done\n"; }, hooks, range);
    return failed == 0 ? causal::cli::kExitOk : causal::cli::kExitHandler;
  }

  if (cmd == "append") {
    causal::store::StoreRequest request;
    request.command = arg(3);
    request.payload = causal::util::FromJson(arg(4));
    request.origin  = "causalctl";
    if (argc > 5) request.causation_id = ParseId(argv[5]);

    auto result = rt.store->Store(request, EchoProjection());
    if (!result) {
      std::cerr << result.Error().message << "\n";
      return causal::cli::ExitCodeFor(result.Error());
    }
    PrintEvent(*result.Row());
    return causal::cli::kExitOk;
  }

  Usage();
  return causal::cli::kExitUsage;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return causal::cli::kExitUsage;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = causal::config::ConfigLoader::LoadFromYaml(config_path);
    causal::observability::InitializeLogging(config);

    int rc = 0;
    {
      auto runtime = causal::factory::Build(config);
      rc           = Run(runtime, cmd, argc, argv);
    }

    causal::observability::ShutdownLogging();
    return rc;
  } catch (const causal::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    causal::observability::ShutdownLogging();
    return causal::cli::kExitNotFound;
  } catch (const causal::util::ValidationError& e) {
    std::cerr << e.what() << "\n";
    causal::observability::ShutdownLogging();
    return causal::cli::kExitUsage;
  } catch (const std::exception& e) {
    CAUSAL_LOG_ERROR("Fatal error", {causal::observability::StringField("error", e.what())});
    causal::observability::ShutdownLogging();
    return causal::cli::kExitFatal;
  }
}
