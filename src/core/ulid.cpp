#include "rid/core/ulid.hpp"

#include <chrono>

#include <sodium.h>

namespace rid::core {
    namespace {
        Status ensure_sodium() noexcept {
            // Runs once per process.
            static const int rc = sodium_init();
            if (rc < 0) {
                return make_status(StatusDomain::External, StatusCode::Unavailable);
            }
            return ok_status();
        }

        TimestampMs now_ms() noexcept {
            using namespace std::chrono;
            const auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
            if (ms < 0) {
                return 0;
            }
            return static_cast<TimestampMs>(ms) & kMaxTimestampMs;
        }

        // 0xff for characters outside the alphabet.
        constexpr std::array<u8, 256> make_decode_table() noexcept {
            std::array<u8, 256> t{};
            for (auto& v : t) {
                v = 0xff;
            }
            for (u8 i = 0; i < 32; ++i) {
                const char c = kUlidAlphabet[i];
                t[static_cast<u8>(c)] = i;
                if (c >= 'A' && c <= 'Z') {
                    t[static_cast<u8>(c - 'A' + 'a')] = i;
                }
            }
            return t;
        }

        constexpr std::array<u8, 256> kDecode = make_decode_table();

        [[nodiscard]] bool increment_random(Ulid* u) noexcept {
            for (u32 i = 15; i >= 6; --i) {
                if (u->b[i] != 0xffu) {
                    ++u->b[i];
                    return true;
                }
                u->b[i] = 0;
            }
            return false;
        }
    } // namespace

    Status ulid_generate(Ulid* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Ulid, StatusCode::Invalid);
        }
        const Status init = ensure_sodium();
        if (!is_ok(init)) {
            return init;
        }

        std::array<u8, kUlidRandomBytes> random{};
        randombytes_buf(random.data(), random.size());
        *out = ulid_from_parts(now_ms(), random);
        return ok_status();
    }

    Status ulid_parse(std::string_view text, Ulid* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Ulid, StatusCode::Invalid);
        }
        if (text.size() != kUlidTextLen) {
            return make_status(StatusDomain::Ulid, StatusCode::InvalidLength);
        }

        u8 digits[kUlidTextLen];
        for (u32 i = 0; i < kUlidTextLen; ++i) {
            const u8 d = kDecode[static_cast<u8>(text[i])];
            if (d == 0xffu) {
                return make_status(StatusDomain::Ulid, StatusCode::InvalidChar);
            }
            digits[i] = d;
        }
        // 26 * 5 = 130 bits; the top two must be clear.
        if (digits[0] > 7) {
            return make_status(StatusDomain::Ulid, StatusCode::InvalidChar);
        }

        u64 hi = 0;
        u64 lo = 0;
        for (u32 i = 0; i < kUlidTextLen; ++i) {
            hi = (hi << 5) | (lo >> 59);
            lo = (lo << 5) | digits[i];
        }

        Ulid u{};
        for (u32 i = 0; i < 8; ++i) {
            u.b[i] = static_cast<u8>((hi >> ((7 - i) * 8)) & 0xffu);
            u.b[8 + i] = static_cast<u8>((lo >> ((7 - i) * 8)) & 0xffu);
        }
        *out = u;
        return ok_status();
    }

    void ulid_render(const Ulid& u, UlidText* out) noexcept {
        if (out == nullptr) {
            return;
        }
        u64 hi = 0;
        u64 lo = 0;
        for (u32 i = 0; i < 8; ++i) {
            hi = (hi << 8) | u.b[i];
            lo = (lo << 8) | u.b[8 + i];
        }

        // Emit 5-bit digits from least significant, shifting the 128-bit value right.
        for (u32 i = kUlidTextLen; i > 0; --i) {
            out->c[i - 1] = kUlidAlphabet[lo & 0x1fu];
            lo = (lo >> 5) | (hi << 59);
            hi >>= 5;
        }
        out->c[kUlidTextLen] = '\0';
    }

    std::string ulid_to_string(const Ulid& u) {
        UlidText t{};
        ulid_render(u, &t);
        return std::string(t.view());
    }

    Status UlidGenerator::next(Ulid* out) noexcept {
        if (out == nullptr) {
            return make_status(StatusDomain::Ulid, StatusCode::Invalid);
        }

        std::lock_guard<std::mutex> lock(mutex_);

        const TimestampMs ts = now_ms();
        if (!have_last_ || ts > ulid_timestamp_ms(last_)) {
            Ulid fresh{};
            const Status s = ulid_generate(&fresh);
            if (!is_ok(s)) {
                return s;
            }
            // ulid_generate may observe a later millisecond; keep the one we compared.
            std::array<u8, kUlidRandomBytes> random{};
            for (u32 i = 0; i < kUlidRandomBytes; ++i) {
                random[i] = fresh.b[6 + i];
            }
            last_ = ulid_from_parts(ts, random);
            have_last_ = true;
            *out = last_;
            return ok_status();
        }

        Ulid bumped = last_;
        if (!increment_random(&bumped)) {
            return make_status(StatusDomain::Ulid, StatusCode::Unavailable);
        }
        last_ = bumped;
        *out = last_;
        return ok_status();
    }

} // namespace rid::core
