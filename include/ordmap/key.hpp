#pragma once

/// @file key.hpp
/// @author Aleksandr Loshkarev
/// @brief ADL-based key canonicalization: C++ values -> canonical string keys.
///
/// Provides:
///   - to_key() overloads for strings, characters, bool, integers, floating
///     point, nullptr and std::optional
///   - DefaultKeyPolicy: the KeyPolicy used by OrderedMap unless another is given
///   - canonical_key() helper
///
/// Every key is reduced to a std::string before it touches the store or the
/// order ledger. Two different source keys with the same canonical form are
/// the same key: OrderedMap<V> cannot tell 1, "1" and 1.0 apart.
///
/// User types opt in with an overload found by argument-dependent lookup:
/// @code
///   namespace geo {
///   struct Cell { int x, y; };
///   inline void to_key(std::string& k, const Cell& c) {
///       k = std::to_string(c.x) + ":" + std::to_string(c.y);
///   }
///   } // namespace geo
///
///   ordmap::OrderedMap<double> heat;
///   heat.set(geo::Cell{3, 4}, 0.5);
///   heat.has("3:4");  // true
/// @endcode

#include "detail/number.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace ordmap {

// =====================================================================
// to_key: C++ value -> canonical key
// =====================================================================

inline void to_key(std::string& k, const std::string& v) { k = v; }
inline void to_key(std::string& k, std::string_view v)   { k.assign(v.data(), v.size()); }
inline void to_key(std::string& k, const char* v)        { if (v) k.assign(v); else k.assign("null"); }
inline void to_key(std::string& k, char v)               { k.assign(1, v); }
inline void to_key(std::string& k, bool v)               { k.assign(v ? "true" : "false"); }
inline void to_key(std::string& k, std::nullptr_t)       { k.assign("null"); }
inline void to_key(std::string& k, float v)              { k.clear(); detail::append_float(k, v); }
inline void to_key(std::string& k, double v)             { k.clear(); detail::append_float(k, v); }
inline void to_key(std::string& k, long double v)        { k.clear(); detail::append_float(k, v); }

template <typename T,
          std::enable_if_t<std::is_integral_v<T> &&
                           !std::is_same_v<T, bool> &&
                           !std::is_same_v<T, char>, int> = 0>
void to_key(std::string& k, T v) {
    k.clear();
    if constexpr (std::is_signed_v<T>) {
        detail::append_i64(k, static_cast<int64_t>(v));
    } else {
        detail::append_u64(k, static_cast<uint64_t>(v));
    }
}

template <typename T,
          std::enable_if_t<std::is_enum_v<T>, int> = 0>
void to_key(std::string& k, T v) {
    to_key(k, static_cast<std::underlying_type_t<T>>(v));
}

template <typename T>
void to_key(std::string& k, const std::optional<T>& v) {
    if (v.has_value()) {
        to_key(k, *v);
    } else {
        k.assign("null");
    }
}

// =====================================================================
// Key policies
// =====================================================================

/// @brief Canonicalizes keys through the to_key() overload set.
///
/// A KeyPolicy is any default-constructible callable that maps a key of
/// any accepted type to its canonical std::string. Replace it to change
/// canonicalization for a whole map type, e.g. case-folding keys.
struct DefaultKeyPolicy {
    std::string operator()(const std::string& key) const { return key; }
    std::string operator()(std::string&& key) const { return std::move(key); }

    template <typename T>
    std::string operator()(const T& key) const {
        std::string out;
        to_key(out, key);  // ADL picks up user overloads
        return out;
    }
};

/// @brief Canonical form of key under DefaultKeyPolicy.
template <typename T>
[[nodiscard]] std::string canonical_key(const T& key) {
    return DefaultKeyPolicy{}(key);
}

} // namespace ordmap
