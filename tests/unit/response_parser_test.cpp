#include "internal/oracle/response_parser.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using blockforge::oracle::ParseOracleResponse;

std::string FailureOf(const std::string& content) {
  try {
    (void)ParseOracleResponse(content);
  } catch (const blockforge::util::OracleFailure& e) {
    return e.what();
  }
  return {};
}

void TestWellFormedResponse() {
  const auto code = ParseOracleResponse(R"(Here is your block.

## Backend Code
```python
class BlockExecutor:
    async def fetch_data(self):
        return {"temp": 21}
```

## Frontend Code
```tsx
export default function Block({ data }) { return <div>{data.temp}</div>; }
```

## Explanation
Fetches the current temperature.
Shows it as a number.
)");

  assert(code.backend_code.find("class BlockExecutor:") == 0);
  assert(code.backend_code.find("return {\"temp\": 21}\n") != std::string::npos);
  assert(code.frontend_code.find("export default function Block") == 0);
  assert(code.explanation == "Fetches the current temperature.\nShows it as a number.");
}

void TestHeadingsAreMatchedOnTrimmedLines() {
  const auto code = ParseOracleResponse("  ## Backend Code  \r\n\r\n```\r\nx = 1\r\n```\r\n## Frontend Code\n```\n```\n## Explanation\n");
  assert(code.backend_code == "x = 1\n");
  assert(code.frontend_code.empty());
  assert(code.explanation.empty());
}

void TestMissingSectionsFail() {
  assert(FailureOf("no headings at all").find("'## Backend Code' section") != std::string::npos);
  assert(FailureOf("## Backend Code\n```\nx = 1\n```\n## Explanation\ntext\n").find("'## Frontend Code' section") != std::string::npos);
  assert(FailureOf("## Backend Code\n```\nx = 1\n```\n## Frontend Code\n```\n```\n").find("'## Explanation' section") !=
         std::string::npos);
}

void TestFenceProblemsFail() {
  assert(FailureOf("## Backend Code\nx = 1\n## Frontend Code\n```\n```\n## Explanation\n").find("no code fence") != std::string::npos);
  assert(FailureOf("## Backend Code\n```python\nx = 1\n").find("unterminated code fence") != std::string::npos);
  assert(FailureOf("## Backend Code\n```python\n   \n```\n## Frontend Code\n```\n```\n## Explanation\n").find("empty backend") !=
         std::string::npos);
}

} // namespace

int main() {
  TestWellFormedResponse();
  TestHeadingsAreMatchedOnTrimmedLines();
  TestMissingSectionsFail();
  TestFenceProblemsFail();

  std::cout << "blockforge_unit_response_parser: pass\n";
  return 0;
}
