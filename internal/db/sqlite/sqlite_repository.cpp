#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/util/artikul.hpp"

namespace gearledger::db::sqlite {

using gearledger::db::ErrorCode;
using gearledger::db::Result;

namespace {

constexpr const char* kSelectColumns =
    "SELECT id,artikul,normalized_key,client,client_key,quantity,weight,brand,description,"
    "sale_price,total_price,last_updated,created_at FROM results";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
    sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
    return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

model::ResultRecord ReadRow(sqlite3_stmt* st) {
    model::ResultRecord r;
    r.id             = ColI64(st, 0);
    r.artikul        = ColText(st, 1);
    r.normalized_key = ColText(st, 2);
    r.client         = ColText(st, 3);
    r.client_key     = ColText(st, 4);
    r.quantity       = ColI64(st, 5);
    r.weight         = sqlite3_column_double(st, 6);
    r.brand          = ColText(st, 7);
    r.description    = ColText(st, 8);
    r.sale_price     = sqlite3_column_double(st, 9);
    r.total_price    = sqlite3_column_double(st, 10);
    r.last_updated   = ColText(st, 11);
    r.created_at     = ColText(st, 12);
    return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool)
    : pool_(std::move(pool)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
    return std::make_unique<SqliteTransaction>(pool_->Acquire(), mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::kBusy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::kDuplicateKey, sqlite3_errmsg(db));
        case SQLITE_IOERR:
        case SQLITE_CORRUPT:
        case SQLITE_FULL:
            return Result::Err(ErrorCode::kStorage, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Lookup
// ------------------------------------------------------------------

std::optional<model::ResultRecord>
SqliteRepository::FindByKey(Transaction& t, const std::string& normalized_key, const std::string& client_key) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kSelectColumns) + " WHERE normalized_key=? AND client_key=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindText(st, 1, normalized_key);
    BindText(st, 2, client_key);

    std::optional<model::ResultRecord> out;
    if (sqlite3_step(st) == SQLITE_ROW) {
        out = ReadRow(st);
    }
    sqlite3_finalize(st);
    return out;
}

std::optional<model::ResultRecord> SqliteRepository::GetResult(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string(kSelectColumns) + " WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return std::nullopt;

    BindI64(st, 1, id);

    std::optional<model::ResultRecord> out;
    if (sqlite3_step(st) == SQLITE_ROW) {
        out = ReadRow(st);
    }
    sqlite3_finalize(st);
    return out;
}

std::vector<model::ResultRecord>
SqliteRepository::ListResults(Transaction& t, const std::optional<std::string>& client_key) {
    auto* db = TX(t).Handle();

    std::string sql = kSelectColumns;
    if (client_key) {
        sql += " WHERE client_key=?";
    }
    sql += " ORDER BY last_updated DESC, id DESC;";

    std::vector<model::ResultRecord> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return out;

    if (client_key) {
        BindText(st, 1, *client_key);
    }

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ReadRow(st));
    }
    sqlite3_finalize(st);
    return out;
}

std::vector<std::string> SqliteRepository::ListClients(Transaction& t) {
    auto* db = TX(t).Handle();

    const char* sql = "SELECT DISTINCT client FROM results ORDER BY client;";

    std::vector<std::string> out;

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return out;

    while (sqlite3_step(st) == SQLITE_ROW) {
        out.push_back(ColText(st, 0));
    }
    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

Result SqliteRepository::InsertResult(Transaction& t, model::ResultRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO results(artikul,normalized_key,client,client_key,quantity,weight,brand,description,"
        "sale_price,total_price,last_updated,created_at) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));

    BindText(st, 1, r.artikul);
    BindText(st, 2, r.normalized_key);
    BindText(st, 3, r.client);
    BindText(st, 4, r.client_key);
    BindI64(st, 5, r.quantity);
    BindDouble(st, 6, r.weight);
    BindText(st, 7, r.brand);
    BindText(st, 8, r.description);
    BindDouble(st, 9, r.sale_price);
    BindDouble(st, 10, r.total_price);
    BindText(st, 11, r.last_updated);
    BindText(st, 12, r.created_at);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result) {
        r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    }
    return result;
}

Result SqliteRepository::UpdateResult(Transaction& t, const model::ResultRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE results SET quantity=?,weight=?,brand=?,description=?,sale_price=?,total_price=?,last_updated=? "
        "WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));

    BindI64(st, 1, r.quantity);
    BindDouble(st, 2, r.weight);
    BindText(st, 3, r.brand);
    BindText(st, 4, r.description);
    BindDouble(st, 5, r.sale_price);
    BindDouble(st, 6, r.total_price);
    BindText(st, 7, r.last_updated);
    BindI64(st, 8, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::kNotFound, "result not found");
    return Translate(db, rc);
}

Result SqliteRepository::PatchResult(Transaction& t, int64_t id, const model::ResultPatch& patch, const std::string& now) {
    auto* db = TX(t).Handle();

    // Column names come from this fixed list only; values are bound.
    std::string sql = "UPDATE results SET ";
    if (patch.artikul) sql += "artikul=?,normalized_key=?,";
    if (patch.client) sql += "client=?,client_key=?,";
    if (patch.quantity) sql += "quantity=?,";
    if (patch.weight) sql += "weight=?,";
    if (patch.brand) sql += "brand=?,";
    if (patch.description) sql += "description=?,";
    if (patch.sale_price) sql += "sale_price=?,";
    if (patch.total_price) sql += "total_price=?,";
    sql += "last_updated=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));

    int idx = 1;
    if (patch.artikul) {
        BindText(st, idx++, *patch.artikul);
        BindText(st, idx++, util::NormalizeArtikul(*patch.artikul));
    }
    if (patch.client) {
        BindText(st, idx++, *patch.client);
        BindText(st, idx++, util::ToUpper(*patch.client));
    }
    if (patch.quantity) BindI64(st, idx++, *patch.quantity);
    if (patch.weight) BindDouble(st, idx++, *patch.weight);
    if (patch.brand) BindText(st, idx++, *patch.brand);
    if (patch.description) BindText(st, idx++, *patch.description);
    if (patch.sale_price) BindDouble(st, idx++, *patch.sale_price);
    if (patch.total_price) BindDouble(st, idx++, *patch.total_price);
    BindText(st, idx++, now);
    BindI64(st, idx, id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::kNotFound, "result not found");
    return Translate(db, rc);
}

Result SqliteRepository::DeleteResult(Transaction& t, int64_t id) {
    auto* db = TX(t).Handle();

    const char* sql = "DELETE FROM results WHERE id=?;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));

    BindI64(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::kNotFound, "result not found");
    return Translate(db, rc);
}

Result SqliteRepository::ClearResults(Transaction& t, const std::optional<std::string>& client_key, int64_t* deleted) {
    auto* db = TX(t).Handle();

    const char* sql = client_key ? "DELETE FROM results WHERE client_key=?;" : "DELETE FROM results;";
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::kInternal, sqlite3_errmsg(db));

    if (client_key) {
        BindText(st, 1, *client_key);
    }
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    auto result = Translate(db, rc);
    if (result && deleted) {
        *deleted = sqlite3_changes(db);
    }
    return result;
}

} // namespace gearledger::db::sqlite
