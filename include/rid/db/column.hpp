#pragma once

#include "rid/core/errors.hpp"
#include "rid/core/resource_id.hpp"

struct sqlite3_stmt;

namespace rid::db {

    inline constexpr const char* kVarcharTypeName = "VARCHAR";

    // True for a declared column type of VARCHAR, case-insensitive, with an
    // optional length modifier ("varchar(30)"). Anything else, including a
    // missing declared type, is rejected.
    [[nodiscard]] bool varchar_compatible(const char* decl_type) noexcept;

    // Binds the 30-character canonical text. Never binds NULL.
    rid::core::Status column_bind_resource_id(sqlite3_stmt* stmt, int index,
        const rid::core::ResourceId& id) noexcept;

    // Reads column col of the current row through the full parse path.
    //   Db/Unsupported  declared type is known and not VARCHAR
    //   Db/NotFound     value is NULL
    //   Db/Invalid      value is not TEXT
    //   Db/Corrupt      text does not parse; aux holds the parse status
    rid::core::Status column_read_resource_id(sqlite3_stmt* stmt, int col,
        rid::core::ResourceId* out) noexcept;

    // Per-type column capability.
    template <typename T>
    struct ColumnTraits;

    template <>
    struct ColumnTraits<rid::core::ResourceId> {
        static constexpr const char* kTypeName = kVarcharTypeName;

        [[nodiscard]] static bool compatible(const char* decl_type) noexcept {
            return varchar_compatible(decl_type);
        }

        static rid::core::Status bind(sqlite3_stmt* stmt, int index, const rid::core::ResourceId& id) noexcept {
            return column_bind_resource_id(stmt, index, id);
        }

        static rid::core::Status read(sqlite3_stmt* stmt, int col, rid::core::ResourceId* out) noexcept {
            return column_read_resource_id(stmt, col, out);
        }
    };

} // namespace rid::db
