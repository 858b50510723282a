#pragma once

#include "sqlite_db.hpp"

namespace blockforge::db::sqlite {

// Creates the block tables when missing and records the schema version.
void BootstrapSchema(SqliteDB& db);

} // namespace blockforge::db::sqlite
