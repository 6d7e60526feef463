#pragma once

#include <array>
#include <compare>
#include <concepts>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>
#include <type_traits>

#include "rid/core/errors.hpp"
#include "rid/core/types.hpp"
#include "rid/core/ulid.hpp"

namespace rid::core {

    inline constexpr u32 kResourceTagLen = 4;
    inline constexpr u32 kResourceIdTextLen = kResourceTagLen + kUlidTextLen;
    static_assert(kResourceIdTextLen == 30);

    struct ResourceIdText {
        char c[kResourceIdTextLen + 1]{};
        [[nodiscard]] std::string_view view() const noexcept { return {c, kResourceIdTextLen}; }
    };

    // Typed identifier: 4-byte uppercase resource tag followed by a ULID.
    // Only the functions below produce valid values; the default value is the
    // invalid identifier (all zero).
    class ResourceId {
    public:
        constexpr ResourceId() noexcept = default;

        [[nodiscard]] std::string_view resource() const noexcept { return {resource_.data(), resource_.size()}; }
        [[nodiscard]] constexpr const Ulid& ulid() const noexcept { return ulid_; }
        [[nodiscard]] constexpr bool is_valid() const noexcept { return resource_[0] != '\0'; }

        friend constexpr bool operator==(const ResourceId&, const ResourceId&) noexcept = default;

        // Tag bytes as unsigned, then ULID: the same order as the canonical text.
        friend constexpr std::strong_ordering operator<=>(const ResourceId& a, const ResourceId& b) noexcept {
            for (u32 i = 0; i < kResourceTagLen; ++i) {
                const auto ca = static_cast<u8>(a.resource_[i]);
                const auto cb = static_cast<u8>(b.resource_[i]);
                if (ca != cb) {
                    return ca <=> cb;
                }
            }
            return a.ulid_ <=> b.ulid_;
        }

    private:
        std::array<char, kResourceTagLen> resource_{};
        Ulid ulid_{};

        friend Status resource_id_make(std::string_view resource, const Ulid& ulid, ResourceId* out) noexcept;
    };

    // Uppercases resource, requires exactly 4 bytes, generates a fresh ULID.
    // ResourceId/InvalidResourceType when the length is wrong.
    Status resource_id_new(std::string_view resource, ResourceId* out) noexcept;

    // Same, drawing the suffix from a monotonic generator.
    Status resource_id_new(std::string_view resource, UlidGenerator& gen, ResourceId* out) noexcept;

    // Composes an identifier from an existing suffix; same tag rules as resource_id_new.
    Status resource_id_make(std::string_view resource, const Ulid& ulid, ResourceId* out) noexcept;

    // Accepts exactly 30 characters: tag (4) + ULID text (26). The tag is
    // uppercased; its characters are not otherwise restricted.
    // ResourceId/InvalidLength, ResourceId/InvalidResourceType, or
    // ResourceId/UnableToDecodeUlid with the Ulid-domain cause in aux.
    Status resource_id_parse(std::string_view text, ResourceId* out) noexcept;

    void resource_id_render(const ResourceId& id, ResourceIdText* out) noexcept;

    [[nodiscard]] std::string resource_id_to_string(const ResourceId& id);

    std::ostream& operator<<(std::ostream& os, const ResourceId& id);

    // Any tag type with an ADL-visible to_string(), e.g. an enum of known resources.
    template <typename T>
    concept ResourceTagLike = !std::convertible_to<const T&, std::string_view> &&
        requires(const T& t) {
            { to_string(t) } -> std::convertible_to<std::string_view>;
        };

    template <ResourceTagLike T>
    Status resource_id_new(const T& tag, ResourceId* out) {
        const auto s = to_string(tag);
        return resource_id_new(std::string_view{s}, out);
    }

    static_assert(sizeof(ResourceId) == kResourceTagLen + sizeof(Ulid));
    static_assert(std::is_trivially_copyable_v<ResourceId>);
    static_assert(std::is_standard_layout_v<ResourceId>);

} // namespace rid::core

namespace std {
template <>
struct hash<rid::core::ResourceId> {
    std::size_t operator()(const rid::core::ResourceId& id) const noexcept {
        // FNV-1a over tag and ULID bytes.
        std::size_t h = 1469598103934665603ull;
        for (char c : id.resource()) {
            h = (h ^ static_cast<unsigned char>(c)) * 1099511628211ull;
        }
        for (auto b : id.ulid().b) {
            h = (h ^ b) * 1099511628211ull;
        }
        return h;
    }
};
} // namespace std
