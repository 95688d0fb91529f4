#include <google/protobuf/struct.pb.h>

#include <iostream>
#include <map>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/json.hpp"

namespace {

using causal::projection::EventMeta;
using causal::projection::Projection;
using google::protobuf::Value;

double Amount(const Value& payload) {
  const auto& fields = payload.struct_value().fields();
  auto        it     = fields.find("amount");
  return it == fields.end() ? 0 : it->second.number_value();
}

std::string Account(const Value& payload) {
  const auto& fields = payload.struct_value().fields();
  auto        it     = fields.find("account");
  return it == fields.end() ? "" : it->second.string_value();
}

Value Balance(const std::string& account, double balance) {
  return causal::util::FromJson(R"({"account":")" + account + R"(","balance":)" + std::to_string(balance) + "}");
}

causal::store::StoreRequest Request(const std::string& command, const std::string& payload_json) {
  causal::store::StoreRequest r;
  r.command = command;
  r.payload = causal::util::FromJson(payload_json);
  r.actor   = "teller-7";
  r.origin  = "branch-office";
  return r;
}

} // namespace

int main(int argc, char** argv) {
  // Optional sqlite file; the default keeps everything in memory.
  auto config = causal::config::ConfigLoader::Defaults();
  if (argc > 1) {
    config.mutable_database()->mutable_sqlite()->set_path(argv[1]);
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
  }
  auto runtime = causal::factory::Build(config);

  // Balances are a read model rebuilt from the log.
  std::map<std::string, double> balances;

  Projection projection([](const Value& payload, const EventMeta&) { return payload; });
  projection
      .On("Deposit",
          [&](const Value& payload, const EventMeta&) {
            const auto account = Account(payload);
            balances[account] += Amount(payload);
            return Balance(account, balances[account]);
          })
      .On("Withdraw",
          [&](const Value& payload, const EventMeta&) {
            const auto account = Account(payload);
            if (balances[account] < Amount(payload)) throw std::runtime_error("insufficient funds");
            balances[account] -= Amount(payload);
            return Balance(account, balances[account]);
          })
      .OnError([](const causal::projection::HandlerError& error) { std::cerr << error.message << '\n'; });

  causal::projection::Hooks hooks;
  hooks.SetDefault([](const Value& result, const causal::db::model::EventRecord& row) {
    std::cout << "[" << row.id << "] " << row.command << " -> " << causal::util::ToJson(result) << '\n';
  });

  // A root event opens the correlation; follow-ups only name their cause.
  auto open = runtime.store->Store(Request("OpenAccount", R"({"account":"acc-1"})"), projection, hooks);
  if (!open) {
    std::cerr << "OpenAccount failed: " << open.Error().message << '\n';
    return 1;
  }

  auto deposit_req         = Request("Deposit", R"({"account":"acc-1","amount":100})");
  deposit_req.causation_id = open.Row()->id;
  auto deposit             = runtime.store->Store(deposit_req, projection, hooks);

  auto fee_req         = Request("Withdraw", R"({"account":"acc-1","amount":2.5})");
  fee_req.causation_id = open.Row()->id;
  (void)runtime.store->Store(fee_req, projection, hooks);

  auto overdraw_req         = Request("Withdraw", R"({"account":"acc-1","amount":1000})");
  overdraw_req.causation_id = deposit.Row()->id;
  auto overdraw             = runtime.store->Store(overdraw_req, projection, hooks);
  if (!overdraw) {
    std::cout << "rejected by read model, still logged as event " << overdraw.Row()->id << '\n';
  }

  // Rebuild the read model from scratch.
  balances.clear();
  runtime.store->CycleThrough(projection, [&] { std::cout << "replayed, acc-1 balance=" << balances["acc-1"] << '\n'; });

  const auto correlation = *open.Row()->correlation_id;
  std::cout << '\n' << runtime.lineage->GenerateEventTree(correlation) << '\n';

  if (auto path = runtime.lineage->GetCriticalPath(correlation)) {
    std::cout << "critical path: " << path->path << " (" << path->Length() << " events)\n";
  }
  return 0;
}
