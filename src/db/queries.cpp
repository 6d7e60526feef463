#include "rid/db/queries.hpp"

#include <sqlite3.h>

#include <string>

#include "rid/db/column.hpp"
#include "state.hpp"

namespace rid::db {

using namespace rid::core;

namespace {
    constexpr u32 kMaxIdentifierLen = 64;

    [[nodiscard]] Status check_target(const char* table, const char* column) noexcept {
        if (!sql_identifier_valid(table) || !sql_identifier_valid(column)) {
            return make_status(StatusDomain::Db, StatusCode::Invalid);
        }
        return ok_status();
    }

    [[nodiscard]] Status prepare(sqlite3* db, const std::string& sql, sqlite3_stmt** out) noexcept {
        *out = nullptr;
        const int rc = sqlite3_prepare_v2(db, sql.c_str(), -1, out, nullptr);
        if (rc != SQLITE_OK || *out == nullptr) {
            if (*out) {
                sqlite3_finalize(*out);
                *out = nullptr;
            }
            // Missing table or column surfaces here as SQLITE_ERROR.
            const StatusCode code = (rc == SQLITE_ERROR) ? StatusCode::NotFound : StatusCode::Unknown;
            return make_status(StatusDomain::Db, code, static_cast<u32>(rc));
        }
        return ok_status();
    }
} // namespace

bool sql_identifier_valid(const char* name) noexcept {
    if (name == nullptr || name[0] == '\0') {
        return false;
    }
    const char first = name[0];
    if (!((first >= 'A' && first <= 'Z') || (first >= 'a' && first <= 'z') || first == '_')) {
        return false;
    }
    u32 len = 0;
    for (const char* p = name; *p; ++p) {
        const char c = *p;
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        if (!ok || ++len > kMaxIdentifierLen) {
            return false;
        }
    }
    return true;
}

Status db_resource_id_put(DbHandle db,
    const char* table,
    const char* column,
    const ResourceId& id,
    i64* rowid_out) noexcept {
    Status s = check_target(table, column);
    if (!is_ok(s)) {
        return s;
    }

    auto& st = detail::db_state();
    std::lock_guard<std::mutex> lock(st.mutex);
    if (!detail::handle_current(st, db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "INSERT INTO ";
    sql += table;
    sql += " (";
    sql += column;
    sql += ") VALUES (?)";

    sqlite3_stmt* stmt = nullptr;
    s = prepare(st.db, sql, &stmt);
    if (!is_ok(s)) {
        return s;
    }

    s = ColumnTraits<ResourceId>::bind(stmt, 1, id);
    if (!is_ok(s)) {
        sqlite3_finalize(stmt);
        return s;
    }

    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        const StatusCode code = (rc == SQLITE_CONSTRAINT) ? StatusCode::Invalid : StatusCode::Unknown;
        return make_status(StatusDomain::Db, code, static_cast<u32>(rc));
    }

    if (rowid_out) {
        *rowid_out = sqlite3_last_insert_rowid(st.db);
    }
    return ok_status();
}

Status db_resource_id_get(DbHandle db,
    const char* table,
    const char* column,
    i64 rowid,
    ResourceId* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    Status s = check_target(table, column);
    if (!is_ok(s)) {
        return s;
    }

    auto& st = detail::db_state();
    std::lock_guard<std::mutex> lock(st.mutex);
    if (!detail::handle_current(st, db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT ";
    sql += column;
    sql += " FROM ";
    sql += table;
    sql += " WHERE rowid = ?";

    sqlite3_stmt* stmt = nullptr;
    s = prepare(st.db, sql, &stmt);
    if (!is_ok(s)) {
        return s;
    }
    sqlite3_bind_int64(stmt, 1, rowid);

    const int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    s = ColumnTraits<ResourceId>::read(stmt, 0, out);
    sqlite3_finalize(stmt);
    return s;
}

Status db_resource_id_scan(DbHandle db,
    const char* table,
    const char* column,
    ScanVisitor visit,
    void* user,
    ScanSummary* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    *out = ScanSummary{};

    Status s = check_target(table, column);
    if (!is_ok(s)) {
        return s;
    }

    auto& st = detail::db_state();
    std::lock_guard<std::mutex> lock(st.mutex);
    if (!detail::handle_current(st, db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    std::string sql = "SELECT rowid, ";
    sql += column;
    sql += " FROM ";
    sql += table;
    sql += " ORDER BY rowid";

    sqlite3_stmt* stmt = nullptr;
    s = prepare(st.db, sql, &stmt);
    if (!is_ok(s)) {
        return s;
    }

    if (!ColumnTraits<ResourceId>::compatible(sqlite3_column_decltype(stmt, 1))) {
        sqlite3_finalize(stmt);
        return make_status(StatusDomain::Db, StatusCode::Unsupported);
    }

    ScanSummary summary{};
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        ScanRow row{};
        row.rowid = sqlite3_column_int64(stmt, 0);
        row.status = ColumnTraits<ResourceId>::read(stmt, 1, &row.id);
        // Fetch text after the decode so the pointer stays valid for the visitor.
        if (sqlite3_column_type(stmt, 1) != SQLITE_NULL) {
            row.text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 1));
            row.text_len = static_cast<u32>(sqlite3_column_bytes(stmt, 1));
        }

        ++summary.rows;
        if (is_ok(row.status)) {
            ++summary.valid;
        } else {
            ++summary.invalid;
        }
        if (visit) {
            visit(row, user);
        }
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        return make_status(StatusDomain::Db, StatusCode::Io, static_cast<u32>(rc));
    }
    *out = summary;
    return ok_status();
}

} // namespace rid::db
