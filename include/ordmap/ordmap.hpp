#pragma once

/// @file ordmap.hpp
/// @author Aleksandr Loshkarev
/// @brief Main header file for the ordmap library.
///
/// @code
///   auto m = ordmap::OrderedMap<int>::from_literals("a", 1, "b", 2);
///   m.set("a", 3);                 // overwrite: order and epoch unchanged
///   m.erase("b");
///   m.set("b", 4);
///   for (const auto& [key, value] : m.entry_iterator()) {
///       // ("a", 3), ("b", 4)
///   }
/// @endcode

#include "config.hpp"
#include "fwd.hpp"
#include "error.hpp"
#include "key.hpp"
#include "sequence.hpp"
#include "iterator.hpp"
#include "ordered_map.hpp"
