#pragma once

/// @file detail/number.hpp
/// @author Aleksandr Loshkarev
/// @brief Number-to-text conversion for canonical keys.
///
/// Canonical numeric keys follow the usual "string coercion" rules:
///   - Integers in plain decimal, no sign for zero.
///   - Floating values use the shortest round-trip digits (std::to_chars),
///     laid out as Number-to-String does:
///       decimal exponent in [-7, 21) -> positional (1e16 -> "10000000000000000",
///                                       1e-6 -> "0.000001", 1.0 -> "1")
///       otherwise                    -> d[.ddd]e+N / d[.ddd]e-N (1e21 -> "1e+21",
///                                       1e-7 -> "1e-7")
///     so an integral floating value and the same integer share one key.
///   - -0.0 -> "0", NaN -> "NaN", +/-inf -> "Infinity" / "-Infinity".

#include "../config.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <system_error>
#include <type_traits>

namespace ordmap::detail {

/// Two-digit pair table "00".."99".
inline constexpr char kDigitPairs[201] =
    "00010203040506070809"
    "10111213141516171819"
    "20212223242526272829"
    "30313233343536373839"
    "40414243444546474849"
    "50515253545556575859"
    "60616263646566676869"
    "70717273747576777879"
    "80818283848586878889"
    "90919293949596979899";

/// Largest double below which every integral value is exact (2^53).
inline constexpr double kMaxExactInteger = 9007199254740992.0;

/// @brief Append the decimal digits of val to out, two digits per division.
inline void append_u64(std::string& out, uint64_t val) {
    char buf[20];
    char* p = buf + sizeof(buf);
    while (val >= 100) {
        const auto idx = static_cast<unsigned>((val % 100) * 2);
        val /= 100;
        p -= 2;
        std::memcpy(p, kDigitPairs + idx, 2);
    }
    if (val >= 10) {
        p -= 2;
        std::memcpy(p, kDigitPairs + val * 2, 2);
    } else {
        *--p = static_cast<char>('0' + val);
    }
    out.append(p, static_cast<size_t>(buf + sizeof(buf) - p));
}

/// @brief Append a signed integer in decimal.
inline void append_i64(std::string& out, int64_t val) {
    if (val < 0) {
        out.push_back('-');
        // Negate in unsigned space so INT64_MIN does not overflow.
        append_u64(out, 0 - static_cast<uint64_t>(val));
    } else {
        append_u64(out, static_cast<uint64_t>(val));
    }
}

/// @brief Lay out a std::to_chars scientific result [first, last) in
/// Number-to-String form.
inline void append_scientific_as_number(std::string& out, const char* first, const char* last) {
    if (*first == '-') {
        out.push_back('-');
        ++first;
    }
    const char* e = std::find(first, last, 'e');

    char digits[48];
    int k = 0;
    for (const char* p = first; p != e; ++p) {
        if (*p != '.') digits[k++] = *p;
    }

    const char* exp_first = e + 1;
    if (exp_first != last && *exp_first == '+') ++exp_first;
    int exp = 0;
    auto [end, ec] = std::from_chars(exp_first, last, exp);
    if (ORDMAP_UNLIKELY(ec != std::errc() || end != last)) {
        throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                                "float key exponent");
    }

    // Position of the decimal point relative to the first digit.
    const int n = exp + 1;
    if (k <= n && n <= 21) {
        out.append(digits, static_cast<size_t>(k));
        out.append(static_cast<size_t>(n - k), '0');
    } else if (0 < n && n <= 21) {
        out.append(digits, static_cast<size_t>(n));
        out.push_back('.');
        out.append(digits + n, static_cast<size_t>(k - n));
    } else if (-6 < n && n <= 0) {
        out += "0.";
        out.append(static_cast<size_t>(-n), '0');
        out.append(digits, static_cast<size_t>(k));
    } else {
        out.push_back(digits[0]);
        if (k > 1) {
            out.push_back('.');
            out.append(digits + 1, static_cast<size_t>(k - 1));
        }
        out.push_back('e');
        out.push_back(n - 1 < 0 ? '-' : '+');
        append_u64(out, static_cast<uint64_t>(n - 1 < 0 ? 1 - n : n - 1));
    }
}

/// @brief Append a floating value in canonical key form.
template <typename Float>
void append_float(std::string& out, Float val) {
    static_assert(std::is_floating_point_v<Float>, "append_float needs a floating type");

    if (ORDMAP_UNLIKELY(std::isnan(val))) {
        out += "NaN";
        return;
    }
    if (ORDMAP_UNLIKELY(std::isinf(val))) {
        out += val < 0 ? "-Infinity" : "Infinity";
        return;
    }
    if (val == 0) {
        // +0.0 and -0.0 alike.
        out.push_back('0');
        return;
    }

    // Fast path for small integral values.
    if (std::fabs(val) < static_cast<Float>(kMaxExactInteger) && val == std::floor(val)) {
        if (val < 0) {
            out.push_back('-');
            append_u64(out, static_cast<uint64_t>(-val));
        } else {
            append_u64(out, static_cast<uint64_t>(val));
        }
        return;
    }

    char buf[64];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), val, std::chars_format::scientific);
    if (ORDMAP_UNLIKELY(ec != std::errc())) {
        // Not reachable for finite values with a 64-byte buffer.
        throw std::system_error(std::make_error_code(ec), "float key formatting");
    }
    append_scientific_as_number(out, buf, ptr);
}

} // namespace ordmap::detail
