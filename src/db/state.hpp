#pragma once

#include <mutex>

#include "rid/db/db.hpp"

struct sqlite3;

namespace rid::db::detail {
    struct DbState {
        sqlite3* db = nullptr;
        u32 generation = 0;
        std::mutex mutex;
    };

    DbState& db_state() noexcept;

    // Caller holds the state mutex.
    [[nodiscard]] inline bool handle_current(const DbState& st, DbHandle h) noexcept {
        return st.db != nullptr && db_handle_valid(h) && h.id == st.generation;
    }
} // namespace rid::db::detail
