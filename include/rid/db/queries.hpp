#pragma once

#include <type_traits>

#include "rid/core/errors.hpp"
#include "rid/core/resource_id.hpp"
#include "rid/db/db.hpp"

namespace rid::db {
    using u32 = rid::core::u32;
    using u64 = rid::core::u64;
    using i64 = rid::core::i64;

    // Table and column names are spliced into SQL, so they must be plain
    // identifiers: [A-Za-z_][A-Za-z0-9_]*, at most 64 bytes.
    [[nodiscard]] bool sql_identifier_valid(const char* name) noexcept;

    rid::core::Status db_resource_id_put(DbHandle db,
        const char* table,
        const char* column,
        const rid::core::ResourceId& id,
        i64* rowid_out) noexcept;

    // Db/NotFound if no such row; otherwise the column decode status.
    rid::core::Status db_resource_id_get(DbHandle db,
        const char* table,
        const char* column,
        i64 rowid,
        rid::core::ResourceId* out) noexcept;

    struct ScanRow {
        i64 rowid{0};
        const char* text{nullptr}; // raw stored text, nullptr for NULL; valid during the callback only
        u32 text_len{0};
        rid::core::Status status{};
        rid::core::ResourceId id{};
    };

    struct ScanSummary {
        u64 rows{0};
        u64 valid{0};
        u64 invalid{0};
    };

    // Called once per row while the connection lock is held; must not call back into db_*.
    using ScanVisitor = void (*)(const ScanRow& row, void* user);

    // Decodes every value of table.column in rowid order. Rows that fail to
    // decode are counted, not fatal. Db/Unsupported if the declared type is
    // not VARCHAR, Db/NotFound if the column does not exist.
    rid::core::Status db_resource_id_scan(DbHandle db,
        const char* table,
        const char* column,
        ScanVisitor visit,
        void* user,
        ScanSummary* out) noexcept;

    static_assert(std::is_trivially_copyable_v<ScanRow>);
    static_assert(std::is_trivially_copyable_v<ScanSummary>);
    static_assert(std::is_standard_layout_v<ScanSummary>);

} // namespace rid::db
