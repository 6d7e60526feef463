#include "rid/db/db.hpp"

#include <sqlite3.h>

#include <cstring>

#include "state.hpp"

namespace rid::db {

using namespace rid::core;

namespace detail {
    DbState& db_state() noexcept {
        static DbState state;
        return state;
    }
} // namespace detail

namespace {
    [[nodiscard]] bool exec_sql(sqlite3* db, const char* sql) noexcept {
        if (!db || !sql) return false;
        char* err_msg = nullptr;
        const int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
        if (err_msg) sqlite3_free(err_msg);
        return rc == SQLITE_OK;
    }
} // namespace

// ============================================================================
// Database Lifecycle
// ============================================================================

Status db_open(const DbConfig& cfg, DbHandle* out) noexcept {
    if (!out) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& st = detail::db_state();
    std::lock_guard<std::mutex> lock(st.mutex);

    // Close existing connection if any
    if (st.db) {
        sqlite3_close(st.db);
        st.db = nullptr;
    }

    const char* path = cfg.path ? cfg.path : ":memory:";
    const int flags = cfg.read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    int rc = sqlite3_open_v2(path, &st.db, flags, nullptr);
    if (rc != SQLITE_OK) {
        // sqlite3_open_v2 may hand back a handle even on failure.
        if (st.db) {
            sqlite3_close(st.db);
            st.db = nullptr;
        }
        const StatusCode code = (rc == SQLITE_CANTOPEN) ? StatusCode::NotFound : StatusCode::Io;
        return make_status(StatusDomain::Db, code, static_cast<u32>(rc));
    }

    if (cfg.busy_timeout_ms > 0) {
        sqlite3_busy_timeout(st.db, static_cast<int>(cfg.busy_timeout_ms));
    }

    if (!cfg.read_only && !exec_sql(st.db, "PRAGMA foreign_keys = ON")) {
        sqlite3_close(st.db);
        st.db = nullptr;
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }

    // Generation keeps handles from a previous open from reaching the new connection.
    ++st.generation;
    if (st.generation == 0) {
        st.generation = 1;
    }
    out->id = st.generation;
    return ok_status();
}

Status db_close(DbHandle db) noexcept {
    if (!db_handle_valid(db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& st = detail::db_state();
    std::lock_guard<std::mutex> lock(st.mutex);

    if (!detail::handle_current(st, db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3_close(st.db);
    st.db = nullptr;
    return ok_status();
}

Status db_exec(DbHandle db, const char* sql) noexcept {
    if (!sql) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& st = detail::db_state();
    std::lock_guard<std::mutex> lock(st.mutex);

    if (!detail::handle_current(st, db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    char* err_msg = nullptr;
    const int rc = sqlite3_exec(st.db, sql, nullptr, nullptr, &err_msg);
    if (err_msg) {
        sqlite3_free(err_msg);
    }
    if (rc != SQLITE_OK) {
        const StatusCode code = (rc == SQLITE_CONSTRAINT) ? StatusCode::Invalid : StatusCode::Unknown;
        return make_status(StatusDomain::Db, code, static_cast<u32>(rc));
    }
    return ok_status();
}

Status db_column_decltype(DbHandle db,
    const char* table,
    const char* column,
    char* out_buffer,
    u32 buffer_size) noexcept {
    if (!table || !column || !out_buffer || buffer_size == 0) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    auto& st = detail::db_state();
    std::lock_guard<std::mutex> lock(st.mutex);

    if (!detail::handle_current(st, db)) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(st.db, "SELECT type FROM pragma_table_info(?) WHERE name = ?", -1, &stmt, nullptr);
    if (rc != SQLITE_OK || stmt == nullptr) {
        if (stmt) sqlite3_finalize(stmt);
        return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(rc));
    }

    sqlite3_bind_text(stmt, 1, table, -1, SQLITE_STATIC);
    sqlite3_bind_text(stmt, 2, column, -1, SQLITE_STATIC);

    rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(stmt);
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }

    const char* type = reinterpret_cast<const char*>(sqlite3_column_text(stmt, 0));
    const size_t len = type ? std::strlen(type) : 0;
    if (len + 1 > buffer_size) {
        sqlite3_finalize(stmt);
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }
    if (len > 0) {
        std::memcpy(out_buffer, type, len);
    }
    out_buffer[len] = '\0';

    sqlite3_finalize(stmt);
    return ok_status();
}

} // namespace rid::db
