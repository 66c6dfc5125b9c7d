#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "name_registry_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)registry::config::ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/registry/state.db"
    wal_mode: true
ledger:
  endpoint: "ledger.internal:443"
  deadline_ms: 2500
  use_tls: true
payment:
  recipient_account: "treasury"
access:
  bootstrap_admin: "ops-principal"
registration:
  subscription_days: 30
logging:
  level: debug
observability:
  tracing_enabled: false
  transport: OTLP_TRANSPORT_HTTP
)");

  auto config = registry::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/registry/state.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.ledger().deadline_ms() == 2500);
  assert(config.ledger().use_tls());
  assert(config.payment().recipient_account() == "treasury");
  assert(config.access().bootstrap_admin() == "ops-principal");
  assert(config.registration().subscription_days() == 30);
  assert(config.logging().level() == "debug");
  assert(config.observability().transport() == registry::runtime::config::OTLP_TRANSPORT_HTTP);
}

void TestDefaultsApplied() {
  auto config = registry::config::ConfigLoader::LoadFromString(R"(ledger:
  endpoint: "localhost:50051"
payment:
  recipient_account: "treasury"
)");
  assert(!config.server().bind_address().empty());
  assert(config.database().has_memory());
  assert(config.registration().subscription_days() == 365);
  assert(config.ledger().deadline_ms() == 0);
}

// an all-digit account id written in quotes must stay a string
void TestQuotedNumericScalarStaysString() {
  auto config = registry::config::ConfigLoader::LoadFromString(R"(ledger:
  endpoint: "localhost:50051"
payment:
  recipient_account: "0012345"
)");
  assert(config.payment().recipient_account() == "0012345");
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  auto config = registry::config::ConfigLoader::LoadFromString(R"(ledger:
  endpoint: "localhost:50051"
payment:
  recipient_account: "treasury"
database:
  sqlite:
    path: "C:\\registry\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\registry\\\"quoted\"\\db.sqlite");
}

void TestRequiredFieldsAndUnknownFields() {
  assert(Rejects(R"(payment:
  recipient_account: "treasury"
)"));
  assert(Rejects(R"(ledger:
  endpoint: "localhost:50051"
)"));
  assert(Rejects(R"(ledger:
  endpoint: "localhost:50051"
payment:
  recipient_account: "treasury"
unknown_field: 123
)"));
  assert(Rejects(R"(ledger:
  endpoint: "localhost:50051"
payment:
  recipient_account: "treasury"
database:
  sqlite:
    wal_mode: true
)"));
}

void TestTimeBoundsRejected() {
  const std::string base = R"(ledger:
  endpoint: "localhost:50051"
payment:
  recipient_account: "treasury"
)";

  // 213504 days in nanoseconds wraps a uint64
  assert(Rejects(base + R"(registration:
  subscription_days: 213504
)"));
  assert(Rejects(base + R"(registration:
  subscription_days: 36501
)"));
  auto longest = registry::config::ConfigLoader::LoadFromString(base + R"(registration:
  subscription_days: 36500
)");
  assert(longest.registration().subscription_days() == registry::config::kMaxSubscriptionDays);

  const std::string ledger_base = R"(payment:
  recipient_account: "treasury"
ledger:
  endpoint: "localhost:50051"
)";
  assert(Rejects(ledger_base + "  deadline_ms: 3600001\n"));
  assert(Rejects(ledger_base + "  deadline_ms: 18446744073709551615\n"));
  auto slowest = registry::config::ConfigLoader::LoadFromString(ledger_base + "  deadline_ms: 3600000\n");
  assert(slowest.ledger().deadline_ms() == registry::config::kMaxLedgerDeadlineMs);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestDefaultsApplied();
  TestQuotedNumericScalarStaysString();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestRequiredFieldsAndUnknownFields();
  TestTimeBoundsRejected();

  std::cout << "name_registry_unit_config_loader: pass\n";
  return 0;
}
