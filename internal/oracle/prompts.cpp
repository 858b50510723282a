#include "prompts.hpp"

namespace blockforge::oracle {

namespace {

constexpr const char* kResponseFormat = R"TXT(
Respond with exactly these three sections:
## Backend Code
```python
[backend code]
```

## Frontend Code
```typescript
[frontend code]
```

## Explanation
[short explanation]
)TXT";

} // namespace

const std::string& GenerationSystemPrompt() {
  static const std::string kPrompt = std::string(R"TXT(You write working code for dashboard blocks. Each block fetches live data from a real public API, feed or web page and shows it in a small React component.

Rules:
- Do not use mock data or placeholder URLs.
- Handle network and parsing errors inside the code.
- Backend: Python 3 using only requests, httpx, beautifulsoup4, pandas, numpy, python-dateutil, jmespath and the standard library.
- Frontend: React with TypeScript, Tailwind CSS and shadcn/ui components.
- Nothing can be installed. Network access is allowed; the file system is not.

The backend must define this class:
```python
class BlockExecutor:
    async def fetch_data(self):
        ...  # return raw data
    async def process_data(self, raw_data):
        ...  # return a JSON-serializable result for the frontend
```

The frontend must export:
```typescript
export function GeneratedBlock({ data, refreshData, isLoading, error }: {
  data: any; refreshData: () => void; isLoading: boolean; error?: string;
}) { ... }
```
)TXT") + kResponseFormat;
  return kPrompt;
}

const std::string& HealingSystemPrompt() {
  static const std::string kPrompt = std::string(R"TXT(You are repairing a dashboard block whose backend code failed.
Keep the BlockExecutor structure and the constraints of the original block. Fix the cause of the error shown and say what was wrong in the explanation.
)TXT") + kResponseFormat;
  return kPrompt;
}

std::string FormatGenerationMessage(const std::string& prompt, const std::optional<GenerationContext>& context) {
  std::string message = "Create a dashboard block for: " + prompt;
  if (context) {
    message += "\n\nContext:\nOriginal request: " + context->original_prompt;
    message += "\nCurrent backend code:\n```python\n" + context->previous_code + "\n```";
    message += "\nRequested change: " + context->iteration;
  }
  return message;
}

std::string FormatHealingMessage(const std::string& original_prompt, const std::string& error_message, const std::string& failed_code) {
  return "Original request: " + original_prompt + "\n\nFailed code:\n```python\n" + failed_code + "\n```\n\nError encountered: " + error_message +
         "\n\nFix the code and explain what was wrong.";
}

} // namespace blockforge::oracle
