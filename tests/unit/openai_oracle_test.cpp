#include "internal/oracle/openai_oracle.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "internal/oracle/prompts.hpp"
#include "internal/util/errors.hpp"

namespace {

using blockforge::oracle::GenerationContext;
using blockforge::oracle::OpenAiOracle;
using blockforge::oracle::OpenAiOracleOptions;

void TestOptionsFromConfig() {
  setenv("BLOCKFORGE_TEST_ORACLE_KEY", "sk-test", 1);

  blockforge::runtime::config::OracleConfig config;
  config.set_endpoint("http://127.0.0.1:9/v1/chat/completions");
  config.set_model("gpt-4o-mini");
  config.set_api_key_env("BLOCKFORGE_TEST_ORACLE_KEY");
  config.set_max_tokens(512);

  const auto options = OpenAiOracleOptions::FromConfig(config);
  assert(options.endpoint == "http://127.0.0.1:9/v1/chat/completions");
  assert(options.model == "gpt-4o-mini");
  assert(options.api_key == "sk-test");
  assert(options.max_tokens == 512);
  assert(options.temperature == 0.1);
  assert(options.request_timeout_ms == 120000);

  unsetenv("BLOCKFORGE_TEST_ORACLE_KEY");
  assert(OpenAiOracleOptions::FromConfig(config).api_key.empty());
}

void TestMessages() {
  const auto plain = blockforge::oracle::FormatGenerationMessage("NYC weather", std::nullopt);
  assert(plain == "Create a dashboard block for: NYC weather");

  GenerationContext context;
  context.original_prompt = "NYC weather";
  context.previous_code   = "class BlockExecutor: ...";
  context.iteration       = "use celsius";
  const auto update       = blockforge::oracle::FormatGenerationMessage("use celsius", context);
  assert(update.find("Original request: NYC weather") != std::string::npos);
  assert(update.find("class BlockExecutor: ...") != std::string::npos);
  assert(update.find("Requested change: use celsius") != std::string::npos);

  const auto heal = blockforge::oracle::FormatHealingMessage("btc price", "KeyError: 'usd'", "broken()");
  assert(heal.find("Error encountered: KeyError: 'usd'") != std::string::npos);
  assert(heal.find("broken()") != std::string::npos);

  assert(blockforge::oracle::GenerationSystemPrompt().find("## Backend Code") != std::string::npos);
  assert(blockforge::oracle::HealingSystemPrompt().find("## Explanation") != std::string::npos);
}

void TestUnreachableEndpointIsOracleFailure() {
  OpenAiOracleOptions options;
  options.endpoint           = "http://127.0.0.1:9/v1/chat/completions";
  options.api_key            = "sk-test";
  options.request_timeout_ms = 2000;
  OpenAiOracle oracle(options);

  bool threw = false;
  try {
    oracle.Generate("NYC weather", std::nullopt);
  } catch (const blockforge::util::OracleFailure& e) {
    threw = std::string(e.what()).find("oracle request failed: ") == 0;
  }
  assert(threw);
}

} // namespace

int main() {
  TestOptionsFromConfig();
  TestMessages();
  TestUnreachableEndpointIsOracleFailure();

  std::cout << "blockforge_unit_openai_oracle: pass\n";
  return 0;
}
