#pragma once

/// @file error.hpp
/// @author Aleksandr Loshkarev
/// @brief Error types for ordmap: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ConstructionError, ConcurrentModificationError,
///     OutOfRangeError (default)
///   - Via error_code: ordmap::errc enum + ordmap_category() (exception-free)
///
/// Use Sequence::try_next() for exception-free iteration.

#include <stdexcept>
#include <string>
#include <system_error>

namespace ordmap {

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief ordmap error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Construction errors (1-49)
    odd_literal_count       = 1,

    // Iteration errors (50-79)
    concurrent_modification = 50,

    // Lookup errors (80-99)
    key_not_found           = 80,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class ordmap_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "ordmap";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                      return "success";
            case errc::odd_literal_count:       return "uneven number of key/value literals";
            case errc::concurrent_modification: return "the map has changed since the iterator was created";
            case errc::key_not_found:           return "key not found";
            default:                            return "unknown ordmap error";
        }
    }
};

} // namespace detail

/// @brief Get the ordmap error category singleton.
inline const std::error_category& ordmap_category() noexcept {
    static const detail::ordmap_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from ordmap::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), ordmap_category()};
}

/// @brief Create an error_condition from ordmap::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), ordmap_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief Malformed construction: an alternating key/value list of odd length.
class ConstructionError : public std::system_error {
public:
    explicit ConstructionError(std::size_t literal_count)
        : std::system_error(make_error_code(errc::odd_literal_count),
                            "got " + std::to_string(literal_count) + " literals")
        , literal_count_(literal_count) {}

    /// @brief Number of literals that were supplied.
    [[nodiscard]] std::size_t literal_count() const noexcept {
        return literal_count_;
    }

private:
    std::size_t literal_count_;
};

/// @brief Iterator advanced after a count-changing mutation of its map.
class ConcurrentModificationError : public std::system_error {
public:
    ConcurrentModificationError()
        : std::system_error(make_error_code(errc::concurrent_modification)) {}
};

/// @brief Missing key on a checked lookup (at()).
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg)
        : std::system_error(make_error_code(errc::key_not_found), msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [step, ec] = seq.try_next();
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace ordmap

// Register ordmap::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<ordmap::errc> : true_type {};
} // namespace std
