#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace blockforge::executor {

// Modules a block may import by name.
const std::vector<std::string>& DefaultAllowedModules();

// Single-quoted Python literal with backslashes, quotes and control characters escaped.
std::string PythonStringLiteral(std::string_view text);

/*
  Produces block_executor.py: the import guard, the generated code, and a
  __main__ entry that builds BlockExecutor, awaits fetch_data() and
  process_data(raw) and prints one JSON document. Exceptions raised by the
  block are printed as {"error": true, ...} on stdout with exit status 1.

  The import guard is a compatibility filter. Modules outside the allowlist
  still load when the interpreter can import them.
*/
std::string WrapBlockCode(const std::string& backend_code, const std::vector<std::string>& allowed_modules);

// Produces execute.py, which runs block_executor.py as __main__.
std::string BuildRunnerScript(const std::filesystem::path& block_executor_path);

} // namespace blockforge::executor
