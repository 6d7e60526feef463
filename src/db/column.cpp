#include "rid/db/column.hpp"

#include <sqlite3.h>

#include <string_view>

namespace rid::db {

using namespace rid::core;

namespace {
    [[nodiscard]] constexpr char ascii_upper(char c) noexcept {
        return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
    }

    [[nodiscard]] bool is_space(char c) noexcept {
        return c == ' ' || c == '\t';
    }
} // namespace

bool varchar_compatible(const char* decl_type) noexcept {
    if (decl_type == nullptr) {
        return false;
    }
    std::string_view t{decl_type};
    while (!t.empty() && is_space(t.front())) t.remove_prefix(1);
    while (!t.empty() && is_space(t.back())) t.remove_suffix(1);

    const std::string_view name{kVarcharTypeName};
    if (t.size() < name.size()) {
        return false;
    }
    for (size_t i = 0; i < name.size(); ++i) {
        if (ascii_upper(t[i]) != name[i]) {
            return false;
        }
    }

    std::string_view rest = t.substr(name.size());
    while (!rest.empty() && is_space(rest.front())) rest.remove_prefix(1);
    if (rest.empty()) {
        return true;
    }
    // Length modifier: "(" digits ")"
    if (rest.size() < 3 || rest.front() != '(' || rest.back() != ')') {
        return false;
    }
    for (char c : rest.substr(1, rest.size() - 2)) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}

Status column_bind_resource_id(sqlite3_stmt* stmt, int index, const ResourceId& id) noexcept {
    if (stmt == nullptr || !id.is_valid()) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    ResourceIdText text{};
    resource_id_render(id, &text);
    const int rc = sqlite3_bind_text(stmt, index, text.c, static_cast<int>(kResourceIdTextLen), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return make_status(StatusDomain::Db, StatusCode::Unknown, static_cast<u32>(rc));
    }
    return ok_status();
}

Status column_read_resource_id(sqlite3_stmt* stmt, int col, ResourceId* out) noexcept {
    if (stmt == nullptr || out == nullptr) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    // Expression columns carry no declared type; those fall through to the value checks.
    const char* decl = sqlite3_column_decltype(stmt, col);
    if (decl != nullptr && !varchar_compatible(decl)) {
        return make_status(StatusDomain::Db, StatusCode::Unsupported);
    }

    const int type = sqlite3_column_type(stmt, col);
    if (type == SQLITE_NULL) {
        return make_status(StatusDomain::Db, StatusCode::NotFound);
    }
    if (type != SQLITE_TEXT) {
        return make_status(StatusDomain::Db, StatusCode::Invalid);
    }

    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    const int len = sqlite3_column_bytes(stmt, col);
    if (text == nullptr || len < 0) {
        return make_status(StatusDomain::Db, StatusCode::Unknown);
    }

    ResourceId parsed{};
    const Status s = resource_id_parse(std::string_view{text, static_cast<size_t>(len)}, &parsed);
    if (!is_ok(s)) {
        return make_wrapped_status(StatusDomain::Db, StatusCode::Corrupt, s);
    }
    *out = parsed;
    return ok_status();
}

} // namespace rid::db
