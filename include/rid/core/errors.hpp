#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <type_traits>

namespace rid::core {
    using u16 = std::uint16_t;
    using u32 = std::uint32_t;

    enum class StatusCode : u16 {
        Ok = 0,
        Unknown,
        Invalid,
        InvalidLength,
        InvalidChar,
        InvalidResourceType,
        UnableToDecodeUlid,
        NotFound,
        Corrupt,
        Io,
        Unsupported,
        Unavailable,
    };

    enum class StatusDomain : u16 {
        Core = 0,
        Ulid,
        ResourceId,
        Db,
        External,
    };

    // aux is free-form. Wrapping errors store their cause there (see status_pack).
    struct Status {
        StatusCode code{StatusCode::Ok};
        StatusDomain domain{StatusDomain::Core};
        u32 aux{0};
    };

    [[nodiscard]] constexpr Status make_status(StatusDomain domain, StatusCode code, u32 aux = 0) noexcept {
        return Status{code, domain, aux};
    }

    [[nodiscard]] constexpr bool is_ok(Status s) noexcept {
        return s.code == StatusCode::Ok;
    }

    [[nodiscard]] constexpr Status ok_status() noexcept {
        return Status{};
    }

    // A status packs into 16 bits (domain:8, code:8). A wrapping status keeps its
    // cause in aux: low 16 bits are the packed cause, high 16 bits are the
    // cause's own packed cause. Chains deeper than two levels are truncated.
    [[nodiscard]] constexpr u32 status_pack(Status s) noexcept {
        return ((static_cast<u32>(s.domain) & 0xffu) << 8) |
               (static_cast<u32>(s.code) & 0xffu) |
               ((s.aux & 0xffffu) << 16);
    }

    [[nodiscard]] constexpr Status status_unpack(u32 packed) noexcept {
        return Status{static_cast<StatusCode>(packed & 0xffu),
                      static_cast<StatusDomain>((packed >> 8) & 0xffu),
                      (packed >> 16) & 0xffffu};
    }

    [[nodiscard]] constexpr Status make_wrapped_status(StatusDomain domain, StatusCode code, Status cause) noexcept {
        return Status{code, domain, status_pack(cause)};
    }

    // Only meaningful for codes that wrap another status.
    [[nodiscard]] constexpr Status status_cause(Status s) noexcept {
        return status_unpack(s.aux);
    }

    [[nodiscard]] constexpr bool operator==(Status a, Status b) noexcept {
        return a.code == b.code && a.domain == b.domain && a.aux == b.aux;
    }

    [[nodiscard]] const char* status_code_name(StatusCode code) noexcept;
    [[nodiscard]] const char* status_domain_name(StatusDomain domain) noexcept;

    // Human-readable message. subject is the offending input, if any.
    [[nodiscard]] std::string status_describe(Status s, std::string_view subject = {});

    static_assert(std::is_trivially_copyable_v<Status>);
    static_assert(std::is_standard_layout_v<Status>);
} // namespace rid::core
