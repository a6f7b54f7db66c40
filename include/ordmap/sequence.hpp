#pragma once

/// @file sequence.hpp
/// @author Aleksandr Loshkarev
/// @brief Lazy sequence interface: has_next / next / exhaustion.
///
/// A Sequence<T> yields values one at a time. next() returns std::nullopt
/// once the sequence is exhausted; failures (e.g. the underlying map changed)
/// are reported as exceptions derived from std::system_error, or as an
/// error_code through try_next(). Exhaustion is never an error.
///
/// Sequences are single-pass and can be consumed by range-for:
/// @code
///   for (const std::string& key : map.key_iterator()) { ... }
/// @endcode

#include "error.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace ordmap {

template <typename T>
class Sequence;

/// @brief Single-pass input iterator over a Sequence<T>.
///
/// Holds the element most recently produced; operator++ advances the
/// underlying sequence and may throw whatever next() throws.
template <typename T>
class SequenceIterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type        = T;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const T*;
    using reference         = const T&;

    SequenceIterator() noexcept = default;

    explicit SequenceIterator(Sequence<T>* seq) : seq_(seq) { fetch(); }

    reference operator*() const noexcept { return *current_; }
    pointer operator->() const noexcept { return &*current_; }

    SequenceIterator& operator++() {
        fetch();
        return *this;
    }

    /// Equal when both are at the end; distinct live positions never compare
    /// equal, which is all a single-pass loop needs.
    bool operator==(const SequenceIterator& other) const noexcept {
        return at_end() && other.at_end();
    }
    bool operator!=(const SequenceIterator& other) const noexcept {
        return !(*this == other);
    }

private:
    Sequence<T>* seq_ = nullptr;
    std::optional<T> current_;

    bool at_end() const noexcept { return !current_.has_value(); }

    void fetch() {
        current_ = seq_->next();
        if (!current_) seq_ = nullptr;
    }
};

/// @brief Abstract lazy sequence.
template <typename T>
class Sequence {
public:
    using value_type = T;
    using iterator   = SequenceIterator<T>;

    virtual ~Sequence() = default;

    /// @brief Whether next() would produce a value.
    /// Reports the same errors as next().
    [[nodiscard]] virtual bool has_next() const = 0;

    /// @brief Produce the next value, or std::nullopt when exhausted.
    virtual std::optional<T> next() = 0;

    /// @brief Exception-free advance.
    /// On a failed advance, value is empty and ec is set.
    result<std::optional<T>> try_next() {
        try {
            return {next(), {}};
        } catch (const std::system_error& e) {
            return {std::nullopt, e.code()};
        }
    }

    iterator begin() { return iterator(this); }
    iterator end() noexcept { return iterator(); }
};

/// @brief Drain the remaining elements of a sequence into a vector.
template <typename T>
[[nodiscard]] std::vector<T> collect(Sequence<T>& seq) {
    std::vector<T> out;
    while (auto v = seq.next()) out.push_back(std::move(*v));
    return out;
}

} // namespace ordmap
