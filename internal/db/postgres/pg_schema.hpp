#pragma once

#include <memory>

#include "pg_pool.hpp"

namespace blockforge::db::postgres {

void BootstrapSchema(const std::shared_ptr<PgPool>& pool);

} // namespace blockforge::db::postgres
