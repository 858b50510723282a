#pragma once

#include <optional>
#include <string>

#include "internal/oracle/oracle.hpp"

namespace blockforge::oracle {

const std::string& GenerationSystemPrompt();
const std::string& HealingSystemPrompt();

std::string FormatGenerationMessage(const std::string& prompt, const std::optional<GenerationContext>& context);
std::string FormatHealingMessage(const std::string& original_prompt, const std::string& error_message, const std::string& failed_code);

} // namespace blockforge::oracle
