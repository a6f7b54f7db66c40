#pragma once

/// @file fwd.hpp
/// @author Aleksandr Loshkarev
/// @brief Forward declarations and type aliases for ordmap.

#include "detail/hash.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace ordmap {

// ─── Forward declarations ───────────────────────────────────────────────
struct DefaultKeyPolicy;

template <typename V, typename KeyPolicy = DefaultKeyPolicy>
class OrderedMap;

template <typename T> class Sequence;
template <typename Map> class KeyIterator;
template <typename Map> class ValueIterator;
template <typename Map> class EntryIterator;

namespace detail {
template <typename Map> class EpochCursor;
} // namespace detail

/// Counter type for mutation epochs and clear() generations.
using epoch_type = std::uint64_t;

// ─── Type aliases ───────────────────────────────────────────────────────

/// @brief Flat, unordered association of canonical keys to values.
///
/// The export format of OrderedMap::to_object(); also accepted by
/// OrderedMap::add_all() and the association constructor.
template <typename V>
using FlatObject = std::unordered_map<std::string, V,
                                      detail::StringHash,
                                      detail::StringEqual>;

/// @brief Default value equality for equals() / contains_value().
///
/// Compares with operator==. For pointer-like values this is identity;
/// pass a custom predicate for structural comparison of what they point to.
struct DefaultEquals {
    template <typename A, typename B>
    bool operator()(const A& a, const B& b) const {
        return a == b;
    }
};

} // namespace ordmap
