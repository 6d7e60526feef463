#include "rid/core/resource_id.hpp"

#include <cstring>
#include <ostream>

namespace rid::core {
    namespace {
        [[nodiscard]] constexpr char ascii_upper(char c) noexcept {
            return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
        }

        [[nodiscard]] Status validate_resource(std::string_view resource) noexcept {
            if (resource.size() != kResourceTagLen) {
                return make_status(StatusDomain::ResourceId, StatusCode::InvalidResourceType);
            }
            return ok_status();
        }
    } // namespace

    Status resource_id_make(std::string_view resource, const Ulid& ulid, ResourceId* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::ResourceId, StatusCode::Invalid);
        }
        const Status s = validate_resource(resource);
        if (!is_ok(s)) {
            return s;
        }
        // A NUL tag would read back as the invalid identifier.
        if (resource[0] == '\0') {
            return make_status(StatusDomain::ResourceId, StatusCode::InvalidResourceType);
        }

        ResourceId id{};
        for (u32 i = 0; i < kResourceTagLen; ++i) {
            id.resource_[i] = ascii_upper(resource[i]);
        }
        id.ulid_ = ulid;
        *out = id;
        return ok_status();
    }

    Status resource_id_new(std::string_view resource, ResourceId* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::ResourceId, StatusCode::Invalid);
        }
        const Status v = validate_resource(resource);
        if (!is_ok(v)) {
            return v;
        }

        Ulid ulid{};
        const Status g = ulid_generate(&ulid);
        if (!is_ok(g)) {
            return g;
        }
        return resource_id_make(resource, ulid, out);
    }

    Status resource_id_new(std::string_view resource, UlidGenerator& gen, ResourceId* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::ResourceId, StatusCode::Invalid);
        }
        const Status v = validate_resource(resource);
        if (!is_ok(v)) {
            return v;
        }

        Ulid ulid{};
        const Status g = gen.next(&ulid);
        if (!is_ok(g)) {
            return g;
        }
        return resource_id_make(resource, ulid, out);
    }

    Status resource_id_parse(std::string_view text, ResourceId* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::ResourceId, StatusCode::Invalid);
        }
        if (text.size() != kResourceIdTextLen) {
            return make_status(StatusDomain::ResourceId, StatusCode::InvalidLength);
        }

        const std::string_view tag = text.substr(0, kResourceTagLen);
        const Status v = validate_resource(tag);
        if (!is_ok(v)) {
            return v;
        }

        Ulid ulid{};
        const Status u = ulid_parse(text.substr(kResourceTagLen), &ulid);
        if (!is_ok(u)) {
            return make_wrapped_status(StatusDomain::ResourceId, StatusCode::UnableToDecodeUlid, u);
        }
        return resource_id_make(tag, ulid, out);
    }

    void resource_id_render(const ResourceId& id, ResourceIdText* out) noexcept {
        if (out == nullptr) {
            return;
        }
        const std::string_view tag = id.resource();
        std::memcpy(out->c, tag.data(), kResourceTagLen);

        UlidText suffix{};
        ulid_render(id.ulid(), &suffix);
        std::memcpy(out->c + kResourceTagLen, suffix.c, kUlidTextLen);
        out->c[kResourceIdTextLen] = '\0';
    }

    std::string resource_id_to_string(const ResourceId& id) {
        ResourceIdText t{};
        resource_id_render(id, &t);
        return std::string(t.view());
    }

    std::ostream& operator<<(std::ostream& os, const ResourceId& id) {
        ResourceIdText t{};
        resource_id_render(id, &t);
        return os << t.view();
    }

} // namespace rid::core
