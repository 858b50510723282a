#pragma once

#include <string>

#include "internal/oracle/oracle.hpp"

namespace blockforge::oracle {

/*
  Parses an oracle answer of the form

    ## Backend Code
    ```python
    ...
    ```
    ## Frontend Code
    ```typescript
    ...
    ```
    ## Explanation
    free text

  Headings are matched on trimmed lines and must appear in this order;
  text before the first heading is ignored. Fence info strings are
  ignored. Throws util::OracleFailure on a missing section, a missing or
  unterminated fence, or an empty backend body.
*/
GeneratedCode ParseOracleResponse(const std::string& content);

} // namespace blockforge::oracle
