#pragma once

/// @file hash.hpp
/// @author Aleksandr Loshkarev
/// @brief String hashing for canonical keys in the primary store.
///
/// Canonical keys are short (identifiers, decimal numbers), so the hasher
/// is tuned for 1-16 byte inputs: one or two unaligned loads and a
/// multiply-xor mix, 16 bytes per round for longer keys. Constants are
/// taken from wyhash v4 (public domain, Wang Yi).

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>

namespace ordmap::detail {

/// @brief Transparent string hasher for std::string / std::string_view keys.
struct StringHash {
    using is_transparent = void;  // Heterogeneous lookup

    static constexpr uint64_t kSeed  = 0xa0761d6478bd642fULL;
    static constexpr uint64_t kSeed2 = 0xe7037ed1a0b428dbULL;

    static uint64_t load64(const char* p) noexcept {
        uint64_t v;
        std::memcpy(&v, p, sizeof(v));
        return v;
    }

    static uint64_t load32(const char* p) noexcept {
        uint32_t v;
        std::memcpy(&v, p, sizeof(v));
        return v;
    }

    static uint64_t mix(uint64_t h, uint64_t a, uint64_t b) noexcept {
        h ^= a;
        h *= kSeed2;
        h ^= b;
        return h * kSeed;
    }

    static size_t hash(const char* data, size_t len) noexcept {
        uint64_t h = kSeed ^ (len * kSeed2);

        if (len == 0) {
            h = mix(h, 0, 0);
        } else if (len < 4) {
            const uint64_t a = static_cast<uint64_t>(static_cast<unsigned char>(data[0])) << 16
                             | static_cast<uint64_t>(static_cast<unsigned char>(data[len >> 1])) << 8
                             | static_cast<uint64_t>(static_cast<unsigned char>(data[len - 1]));
            h = mix(h, a, 0);
        } else if (len <= 8) {
            // First and last four bytes; they overlap below 8.
            h = mix(h, load32(data), load32(data + len - 4));
        } else if (len <= 16) {
            h = mix(h, load64(data), load64(data + len - 8));
        } else {
            const char* p = data;
            for (size_t left = len; left > 16; left -= 16, p += 16)
                h = mix(h, load64(p), load64(p + 8));
            // Tail: the last 16 bytes, overlapping the final round.
            h = mix(h, load64(data + len - 16), load64(data + len - 8));
        }

        h ^= h >> 32;
        h *= kSeed;
        h ^= h >> 29;
        return static_cast<size_t>(h);
    }

    size_t operator()(std::string_view sv) const noexcept {
        return hash(sv.data(), sv.size());
    }

    size_t operator()(const std::string& s) const noexcept {
        return hash(s.data(), s.size());
    }

    size_t operator()(const char* s) const noexcept {
        return hash(s, std::strlen(s));
    }
};

/// @brief Transparent comparator for heterogeneous lookup.
struct StringEqual {
    using is_transparent = void;

    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

} // namespace ordmap::detail
