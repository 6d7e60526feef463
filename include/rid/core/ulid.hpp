#pragma once

#include <array>
#include <compare>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>

#include "rid/core/errors.hpp"
#include "rid/core/types.hpp"

namespace rid::core {

    // 128-bit ULID, big-endian:
    // 0..5 timestamp (48-bit milliseconds since epoch), 6..15 randomness (80 bits).
    // Byte order makes the defaulted comparison numeric, which is also the
    // order of the canonical text.
    struct Ulid {
        std::array<u8, 16> b{};
        friend constexpr bool operator==(const Ulid&, const Ulid&) noexcept = default;
        friend constexpr auto operator<=>(const Ulid&, const Ulid&) noexcept = default;
    };
    static_assert(sizeof(Ulid) == 16);

    inline constexpr u32 kUlidTextLen = 26;
    inline constexpr u32 kUlidRandomBytes = 10;

    // Crockford base32, no I, L, O, U.
    inline constexpr char kUlidAlphabet[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

    struct UlidText {
        char c[kUlidTextLen + 1]{};
        [[nodiscard]] std::string_view view() const noexcept { return {c, kUlidTextLen}; }
    };

    [[nodiscard]] constexpr TimestampMs ulid_timestamp_ms(const Ulid& u) noexcept {
        TimestampMs ts = 0;
        for (u32 i = 0; i < 6; ++i) {
            ts = (ts << 8) | static_cast<TimestampMs>(u.b[i]);
        }
        return ts;
    }

    // Timestamps above kMaxTimestampMs are truncated to 48 bits.
    [[nodiscard]] constexpr Ulid ulid_from_parts(TimestampMs ts,
        const std::array<u8, kUlidRandomBytes>& random) noexcept {
        Ulid u{};
        for (u32 i = 0; i < 6; ++i) {
            u.b[i] = static_cast<u8>((ts >> ((5 - i) * 8)) & 0xffu);
        }
        for (u32 i = 0; i < kUlidRandomBytes; ++i) {
            u.b[6 + i] = random[i];
        }
        return u;
    }

    // Current time + CSPRNG randomness. Thread-safe.
    // Fails only when the entropy source cannot be initialised.
    Status ulid_generate(Ulid* out) noexcept;

    // Case-insensitive decode of exactly 26 characters.
    // Ulid/InvalidLength on wrong length, Ulid/InvalidChar on a character outside
    // the alphabet or a value wider than 128 bits. out is untouched on failure.
    Status ulid_parse(std::string_view text, Ulid* out) noexcept;

    void ulid_render(const Ulid& u, UlidText* out) noexcept;

    [[nodiscard]] std::string ulid_to_string(const Ulid& u);

    // Strictly increasing ULIDs from one generator, even within a millisecond
    // or when the clock steps backwards (the last timestamp is reused and the
    // random field incremented).
    class UlidGenerator {
    public:
        // Ulid/Unavailable once the 80-bit random field would wrap.
        Status next(Ulid* out) noexcept;

    private:
        std::mutex mutex_;
        Ulid last_{};
        bool have_last_{false};
    };

    static_assert(std::is_trivially_copyable_v<Ulid>);
    static_assert(std::is_standard_layout_v<Ulid>);
    static_assert(std::is_trivially_copyable_v<UlidText>);

} // namespace rid::core
