#pragma once

#include <type_traits>

#include "rid/core/errors.hpp"
#include "rid/core/types.hpp"

namespace rid::db {
    using u8 = rid::core::u8;
    using u32 = rid::core::u32;

    struct DbConfig {
        const char* path{nullptr}; // nullptr opens ":memory:"
        u8 read_only{0};
        u32 busy_timeout_ms{0};
    };

    struct DbHandle {
        u32 id{0};
    };

    [[nodiscard]] constexpr bool db_handle_valid(DbHandle db) noexcept {
        return db.id != 0;
    }

    // One process-wide connection; opening again replaces it.
    rid::core::Status db_open(const DbConfig& cfg, DbHandle* out) noexcept;
    rid::core::Status db_close(DbHandle db) noexcept;

    // Runs one or more statements without results.
    rid::core::Status db_exec(DbHandle db, const char* sql) noexcept;

    // Declared type of table.column as written in its definition (may be empty).
    // Db/NotFound if the column does not exist.
    rid::core::Status db_column_decltype(DbHandle db,
        const char* table,
        const char* column,
        char* out_buffer,
        u32 buffer_size) noexcept;

    static_assert(std::is_trivially_copyable_v<DbConfig>);
    static_assert(std::is_trivially_copyable_v<DbHandle>);
    static_assert(std::is_standard_layout_v<DbConfig>);
    static_assert(std::is_standard_layout_v<DbHandle>);

} // namespace rid::db
