#pragma once

#include <optional>
#include <string>

namespace blockforge::oracle {

struct GeneratedCode {
  std::string backend_code;
  std::string frontend_code;
  std::string explanation;
};

// Carried into Generate() when a block is updated.
struct GenerationContext {
  std::string original_prompt;
  std::string previous_code;
  std::string iteration; // the new prompt
};

/*
  Code-generation oracle.

  Both calls block until the oracle answers and throw util::OracleFailure
  when it cannot be reached or its answer cannot be parsed.
*/
class CodeOracle {
 public:
  virtual ~CodeOracle() = default;

  virtual GeneratedCode Generate(const std::string& prompt, const std::optional<GenerationContext>& context) = 0;

  virtual GeneratedCode Heal(const std::string& original_prompt, const std::string& error_message, const std::string& failed_code) = 0;
};

} // namespace blockforge::oracle
