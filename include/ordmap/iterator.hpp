#pragma once

/// @file iterator.hpp
/// @author Aleksandr Loshkarev
/// @brief Fail-fast key, value and entry iterators over an OrderedMap.
///
/// Every iterator snapshots the map's mutation epoch when it is created
/// (after compacting the order ledger) and compares it before each advance:
///   - epoch changed     -> ConcurrentModificationError, iterator stays failed
///   - ledger exhausted  -> std::nullopt
///   - otherwise         -> the element at the cursor
///
/// Only count-changing mutations (new key, successful erase, clear) move the
/// epoch. Overwriting the value of an existing key does not, and later
/// advances observe the new value.
///
/// Iterators keep a pointer to their map; the map must outlive them.

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "sequence.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace ordmap {
namespace detail {

/// @brief Cursor into a compacted ledger guarded by an epoch snapshot.
template <typename Map>
class EpochCursor {
public:
    using mapped_type = typename Map::mapped_type;

    explicit EpochCursor(const Map& map) : map_(&map) {
        map.compact();
        epoch_      = map.epoch_;
        generation_ = map.generation_;
        end_        = map.order_.size();
    }

    /// @throws ConcurrentModificationError if the map changed since creation.
    void check() const {
        if (ORDMAP_UNLIKELY(failed_ ||
                            map_->epoch_ != epoch_ ||
                            map_->generation_ != generation_)) {
            failed_ = true;
            throw ConcurrentModificationError();
        }
    }

    [[nodiscard]] bool has_next() const {
        check();
        return pos_ < end_;
    }

    /// @brief Key at the cursor, then step; nullptr when exhausted.
    const std::string* advance() {
        check();
        if (pos_ >= end_) return nullptr;
        return &map_->order_[pos_++];
    }

    /// Value of a key yielded by advance(). The key is live: the cursor only
    /// walks the ledger prefix compacted at creation, and the epoch has not
    /// moved since.
    const mapped_type& value_of(const std::string& key) const {
        return map_->store_.find(key)->second;
    }

private:
    const Map* map_;
    epoch_type epoch_ = 0;
    epoch_type generation_ = 0;
    std::size_t pos_ = 0;
    std::size_t end_ = 0;  // ledger length after the creation-time compaction
    mutable bool failed_ = false;
};

} // namespace detail

/// @brief Iterates the canonical keys of a map in ledger order.
template <typename Map>
class KeyIterator final : public Sequence<std::string> {
public:
    explicit KeyIterator(const Map& map) : cursor_(map) {}

    [[nodiscard]] bool has_next() const override { return cursor_.has_next(); }

    std::optional<std::string> next() override {
        const std::string* key = cursor_.advance();
        if (!key) return std::nullopt;
        return *key;
    }

private:
    template <typename> friend class EntryIterator;

    detail::EpochCursor<Map> cursor_;
};

/// @brief Iterates the values of a map in ledger order.
/// Values are looked up at advance time.
template <typename Map>
class ValueIterator final : public Sequence<typename Map::mapped_type> {
public:
    using mapped_type = typename Map::mapped_type;

    explicit ValueIterator(const Map& map) : cursor_(map) {}

    [[nodiscard]] bool has_next() const override { return cursor_.has_next(); }

    std::optional<mapped_type> next() override {
        const std::string* key = cursor_.advance();
        if (!key) return std::nullopt;
        return cursor_.value_of(*key);
    }

private:
    detail::EpochCursor<Map> cursor_;
};

/// @brief Iterates (key, value) pairs: the key iterator plus a lookup.
template <typename Map>
class EntryIterator final
    : public Sequence<std::pair<std::string, typename Map::mapped_type>> {
public:
    using mapped_type = typename Map::mapped_type;
    using entry_type  = std::pair<std::string, mapped_type>;

    explicit EntryIterator(const Map& map) : keys_(map) {}

    [[nodiscard]] bool has_next() const override { return keys_.has_next(); }

    std::optional<entry_type> next() override {
        auto key = keys_.next();
        if (!key) return std::nullopt;
        const mapped_type& value = keys_.cursor_.value_of(*key);
        return entry_type(std::move(*key), value);
    }

private:
    KeyIterator<Map> keys_;
};

} // namespace ordmap
