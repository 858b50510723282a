#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"
#include "internal/oracle/oracle.hpp"

namespace blockforge::oracle {

struct OpenAiOracleOptions {
  std::string endpoint           = "https://api.openai.com/v1/chat/completions";
  std::string model              = "gpt-4";
  std::string api_key;
  double      temperature        = 0.1;
  uint32_t    max_tokens         = 4000;
  uint32_t    request_timeout_ms = 120000;

  // api_key is read from the environment variable named by api_key_env.
  static OpenAiOracleOptions FromConfig(const blockforge::runtime::config::OracleConfig& config);
};

/*
  CodeOracle backed by an OpenAI-compatible chat-completions endpoint.

  One blocking HTTPS request per call through libcurl. The reply's
  choices[0].message.content is handed to ParseOracleResponse.
*/
class OpenAiOracle final : public CodeOracle {
 public:
  explicit OpenAiOracle(OpenAiOracleOptions options);

  GeneratedCode Generate(const std::string& prompt, const std::optional<GenerationContext>& context) override;
  GeneratedCode Heal(const std::string& original_prompt, const std::string& error_message, const std::string& failed_code) override;

 private:
  std::string Complete(const std::string& system_prompt, const std::string& user_message);

  OpenAiOracleOptions options_;
};

} // namespace blockforge::oracle
