#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "blockforge_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)blockforge::config::ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
database:
  sqlite:
    path: "/var/lib/blockforge/blocks.db"
    wal_mode: true
executor:
  python_executable: /usr/bin/python3.11
  artifact_root: /tmp/artifacts
  timeout_ms: 5000
  retain_versions: 3
  allowed_modules: [requests, json]
oracle:
  model: gpt-4o
  temperature: 0.4
  max_tokens: 2000
lifecycle:
  default_refresh_interval_sec: 600
  heal_window_sec: 1800
  heal_max_failures_in_window: 2
logging:
  level: debug
observability:
  tracing_enabled: true
  transport: OTLP_TRANSPORT_HTTP
)");

  const auto config = blockforge::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "/var/lib/blockforge/blocks.db");
  assert(config.database().sqlite().wal_mode());
  assert(config.executor().python_executable() == "/usr/bin/python3.11");
  assert(config.executor().timeout_ms() == 5000);
  assert(config.executor().retain_versions() == 3);
  assert(config.executor().allowed_modules_size() == 2);
  assert(config.executor().allowed_modules(0) == "requests");
  assert(config.oracle().model() == "gpt-4o");
  assert(config.oracle().temperature() == 0.4);
  assert(config.oracle().max_tokens() == 2000);
  assert(config.lifecycle().default_refresh_interval_sec() == 600);
  assert(config.lifecycle().heal_window_sec() == 1800);
  assert(config.lifecycle().heal_max_failures_in_window() == 2);
  assert(config.logging().level() == "debug");
  assert(config.observability().tracing_enabled());
  assert(config.observability().transport() == blockforge::runtime::config::OTLP_TRANSPORT_HTTP);

  // untouched fields fall back to defaults
  assert(config.executor().max_output_bytes() == 1024 * 1024);
  assert(config.oracle().endpoint() == "https://api.openai.com/v1/chat/completions");
  assert(config.oracle().api_key_env() == "OPENAI_API_KEY");
}

void TestEmptyDocumentYieldsDefaults() {
  const auto config = blockforge::config::ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == "0.0.0.0:50051");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(config.executor().python_executable() == "python3");
  assert(config.executor().artifact_root() == "block_artifacts");
  assert(config.executor().timeout_ms() == 30000);
  assert(config.executor().retain_versions() == 5);
  assert(config.executor().allowed_modules_size() > 0);
  assert(config.oracle().model() == "gpt-4");
  assert(config.oracle().temperature() == 0.1);
  assert(config.oracle().max_tokens() == 4000);
  assert(config.lifecycle().default_refresh_interval_sec() == 3600);
  assert(config.lifecycle().heal_window_sec() == 3600);
  assert(config.lifecycle().heal_max_failures_in_window() == 1);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto config = blockforge::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "C:\\blocks\\\"quoted\"\\db.sqlite"
)");
  assert(config.database().sqlite().path() == "C:\\blocks\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  const auto config = blockforge::config::ConfigLoader::LoadFromYamlString(R"(executor:
  python_executable: "3"
)");
  assert(config.executor().python_executable() == "3");
}

void TestInvalidDocumentsAreRejected() {
  assert(Rejects("unknown_field: 123\n") && "ConfigLoader must reject unknown fields.");
  assert(Rejects("executor:\n  timeout_budget: 5\n"));
  assert(Rejects("- a\n- b\n"));
  assert(Rejects("database:\n  sqlite:\n    wal_mode: true\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 4\n"));
  assert(Rejects("server: [unterminated\n"));

  bool threw = false;
  try {
    (void)blockforge::config::ConfigLoader::LoadFromYaml("/nonexistent/blockforge.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestEmptyDocumentYieldsDefaults();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestInvalidDocumentsAreRejected();

  std::cout << "blockforge_unit_config_loader: pass\n";
  return 0;
}
