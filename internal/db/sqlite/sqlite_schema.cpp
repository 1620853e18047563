#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace gearledger::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS results ("
      "id INTEGER PRIMARY KEY AUTOINCREMENT, "
      "artikul TEXT NOT NULL, "
      "normalized_key TEXT NOT NULL, "
      "client TEXT NOT NULL, "
      "client_key TEXT NOT NULL, "
      "quantity INTEGER NOT NULL DEFAULT 1, "
      "weight REAL NOT NULL DEFAULT 0, "
      "brand TEXT NOT NULL DEFAULT '', "
      "description TEXT NOT NULL DEFAULT '', "
      "sale_price REAL NOT NULL DEFAULT 0, "
      "total_price REAL NOT NULL DEFAULT 0, "
      "last_updated TEXT NOT NULL, "
      "created_at TEXT NOT NULL);",
      "CREATE UNIQUE INDEX IF NOT EXISTS idx_results_key ON results(normalized_key, client_key);",
      "CREATE INDEX IF NOT EXISTS idx_results_last_updated ON results(last_updated);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT id,artikul,normalized_key,client,client_key,quantity,weight,brand,description,"
          "sale_price,total_price,last_updated,created_at FROM results LIMIT 1;");
}

} // namespace gearledger::db::sqlite
