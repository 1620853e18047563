#pragma once

#include "sqlite_db.hpp"

namespace gearledger::db::sqlite {

// Creates the results table and its indexes when missing.
void BootstrapSchema(SqliteDB& db);

} // namespace gearledger::db::sqlite
