#include "code_wrapper.hpp"

#include <cstdio>

namespace blockforge::executor {

namespace {

constexpr const char* kGuardPrologue = R"PY(import asyncio
import builtins
import inspect
import json
import sys

)PY";

constexpr const char* kGuardBody = R"PY(
_blockforge_original_import = builtins.__import__


def _blockforge_restricted_import(name, globals=None, locals=None, fromlist=(), level=0):
    base_name = name.split('.')[0]
    if level == 0 and base_name not in ALLOWED_PACKAGES and not base_name.startswith('_'):
        try:
            return _blockforge_original_import(name, globals, locals, fromlist, level)
        except ImportError:
            raise ImportError("Package '%s' is not allowed" % name)
    return _blockforge_original_import(name, globals, locals, fromlist, level)


builtins.__import__ = _blockforge_restricted_import

# ---- generated block code ----
)PY";

constexpr const char* kMainEpilogue = R"PY(
# ---- end of generated block code ----


async def _blockforge_resolve(value):
    if inspect.isawaitable(value):
        return await value
    return value


async def _blockforge_main():
    executor = BlockExecutor()
    raw_data = await _blockforge_resolve(executor.fetch_data())
    return await _blockforge_resolve(executor.process_data(raw_data))


if __name__ == "__main__":
    try:
        _blockforge_result = asyncio.run(_blockforge_main())
    except Exception as e:
        print(json.dumps({"error": True, "message": str(e), "type": type(e).__name__}, default=str))
        sys.exit(1)
    print(json.dumps(_blockforge_result, default=str))
)PY";

constexpr const char* kRunnerBody = R"PY(
try:
    runpy.run_path(BLOCK_EXECUTOR, run_name="__main__")
except SystemExit:
    raise
except BaseException as e:
    print(json.dumps({"error": True, "message": str(e), "type": type(e).__name__}, default=str))
    sys.exit(1)
)PY";

} // namespace

const std::vector<std::string>& DefaultAllowedModules() {
  static const std::vector<std::string> kModules = {
      "requests", "httpx", "beautifulsoup4", "bs4",         "pandas",    "numpy",     "dateutil",
      "jmespath", "json",  "datetime",       "time",        "urllib",    "re",        "math",
      "statistics", "collections", "itertools", "functools", "typing", "asyncio", "aiohttp",
  };
  return kModules;
}

std::string PythonStringLiteral(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 2);
  out.push_back('\'');
  for (const char c : text) {
    switch (c) {
      case '\\':
        out += "\\\\";
        break;
      case '\'':
        out += "\\'";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\x%02x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          out += buf;
        } else {
          out.push_back(c);
        }
    }
  }
  out.push_back('\'');
  return out;
}

std::string WrapBlockCode(const std::string& backend_code, const std::vector<std::string>& allowed_modules) {
  const auto& modules = allowed_modules.empty() ? DefaultAllowedModules() : allowed_modules;

  std::string script = kGuardPrologue;
  script += "ALLOWED_PACKAGES = {";
  for (std::size_t i = 0; i < modules.size(); ++i) {
    if (i != 0) script += ", ";
    script += PythonStringLiteral(modules[i]);
  }
  script += "}\n";
  script += kGuardBody;
  script += backend_code;
  if (!backend_code.empty() && backend_code.back() != '\n') {
    script.push_back('\n');
  }
  script += kMainEpilogue;
  return script;
}

std::string BuildRunnerScript(const std::filesystem::path& block_executor_path) {
  std::string script = "import json\nimport runpy\nimport sys\n\n";
  script += "BLOCK_EXECUTOR = " + PythonStringLiteral(block_executor_path.string()) + "\n";
  script += kRunnerBody;
  return script;
}

} // namespace blockforge::executor
