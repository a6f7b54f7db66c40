#pragma once

/// @file ordered_map.hpp
/// @author Aleksandr Loshkarev
/// @brief Library core: OrderedMap, an insertion-ordered hash map with
///        fail-fast iteration.
///
/// Implementation:
///   - Primary store: pmr::unordered_map from canonical key to value,
///     O(1) set / find / erase
///   - Order ledger: pmr::vector of canonical keys in insertion order;
///     erase() leaves the key behind, so the ledger may hold stale and
///     duplicate keys until the next compaction
///   - Compaction: a filter pass dropping stale keys and, only if duplicates
///     remain, a dedup pass with a witnessed set. Runs when erase() leaves
///     more than ORDMAP_COMPACTION_FACTOR ledger entries per live key, and
///     before every order-sensitive read
///   - Mutation epoch: bumped by every count-changing call; iterators
///     snapshot it and fail fast once it moves
///
/// Keys of any type are canonicalized to std::string by KeyPolicy
/// (DefaultKeyPolicy: the to_key() overloads from key.hpp).

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "iterator.hpp"
#include "key.hpp"

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace ordmap {
namespace detail {

/// True for ranges whose elements have .first / .second (std::map,
/// std::unordered_map, FlatObject, vector<pair<...>>).
template <typename T, typename = void>
struct is_association : std::false_type {};

template <typename T>
struct is_association<T, std::void_t<
        decltype(std::begin(std::declval<const T&>())->first),
        decltype(std::begin(std::declval<const T&>())->second),
        decltype(std::end(std::declval<const T&>()))>> : std::true_type {};

template <typename T>
inline constexpr bool is_association_v = is_association<T>::value;

} // namespace detail

template <typename V, typename KeyPolicy>
class OrderedMap {
public:
    using key_type    = std::string;
    using mapped_type = V;
    using size_type   = std::size_t;
    using key_policy  = KeyPolicy;
    using store_type  = std::pmr::unordered_map<std::string, V,
                                                detail::StringHash,
                                                detail::StringEqual>;
    using ledger_type = std::pmr::vector<std::string>;

    using key_iterator_type   = KeyIterator<OrderedMap>;
    using value_iterator_type = ValueIterator<OrderedMap>;
    using entry_iterator_type = EntryIterator<OrderedMap>;

    // ─── Construction ───────────────────────────────────────────────────

    OrderedMap() : OrderedMap(std::pmr::get_default_resource()) {}

    explicit OrderedMap(std::pmr::memory_resource* mr)
        : store_(mr), order_(mr) {}

    /// Copy: same pairs in the same order, independent storage.
    /// Uses other's memory_resource unless mr is given.
    OrderedMap(const OrderedMap& other, std::pmr::memory_resource* mr = nullptr)
        : OrderedMap(mr ? mr : other.resource()) {
        add_all(other);
    }

    OrderedMap(OrderedMap&& other)
        : store_(std::move(other.store_))
        , order_(std::move(other.order_))
        , epoch_(other.epoch_) {
        other.reset_moved_from();
    }

    /// Import every pair of a generic association, in its iteration order.
    template <typename Assoc,
              std::enable_if_t<detail::is_association_v<Assoc>, int> = 0>
    explicit OrderedMap(const Assoc& assoc,
                        std::pmr::memory_resource* mr = std::pmr::get_default_resource())
        : OrderedMap(mr) {
        add_all(assoc);
    }

    /// {{"key", value}, ...}
    OrderedMap(std::initializer_list<std::pair<std::string, V>> init,
               std::pmr::memory_resource* mr = std::pmr::get_default_resource())
        : OrderedMap(mr) {
        for (const auto& [k, v] : init) set(k, v);
    }

    /// @brief Build from alternating key, value, key, value, ... literals.
    /// @throws ConstructionError on an odd number of literals.
    template <typename... Args>
    [[nodiscard]] static OrderedMap from_literals(Args&&... args) {
        if constexpr (sizeof...(Args) % 2 != 0) {
            throw ConstructionError(sizeof...(Args));
        } else {
            OrderedMap out;
            if constexpr (sizeof...(Args) > 0) out.set_pairs(std::forward<Args>(args)...);
            return out;
        }
    }

    /// @brief Build from a runtime alternating sequence [first, last).
    /// Even positions are keys, odd positions the values that follow them.
    /// @throws ConstructionError on an odd number of elements.
    template <typename It>
    [[nodiscard]] static OrderedMap from_flat(
            It first, It last,
            std::pmr::memory_resource* mr = std::pmr::get_default_resource()) {
        const auto n = static_cast<std::size_t>(std::distance(first, last));
        if (ORDMAP_UNLIKELY(n % 2 != 0)) throw ConstructionError(n);
        OrderedMap out(mr);
        while (first != last) {
            It key = first++;
            out.set(*key, V(*first));
            ++first;
        }
        return out;
    }

    OrderedMap& operator=(const OrderedMap& other) {
        if (this != &other) {
            clear();
            add_all(other);
        }
        return *this;
    }

    OrderedMap& operator=(OrderedMap&& other) {
        if (this != &other) {
            clear();
            // Element-wise when the resources differ, O(1) otherwise.
            store_ = std::move(other.store_);
            order_ = std::move(other.order_);
            epoch_ = other.epoch_;
            other.reset_moved_from();
        }
        return *this;
    }

    ~OrderedMap() = default;

    /// @brief Independent copy with the same pairs and order.
    [[nodiscard]] OrderedMap clone() const { return OrderedMap(*this); }

    // ─── Capacity ───────────────────────────────────────────────────────

    [[nodiscard]] size_type size() const noexcept { return store_.size(); }
    [[nodiscard]] bool empty() const noexcept { return store_.empty(); }

    /// Mutation epoch: moves on every count-changing call, never on overwrite.
    [[nodiscard]] epoch_type epoch() const noexcept { return epoch_; }

    /// The order ledger as it stands, stale and duplicate keys included.
    [[nodiscard]] const ledger_type& ledger() const noexcept { return order_; }

    [[nodiscard]] std::pmr::memory_resource* resource() const noexcept {
        return store_.get_allocator().resource();
    }

    [[nodiscard]] const key_policy& policy() const noexcept { return policy_; }

    // ─── Primary store ──────────────────────────────────────────────────

    /// @brief Insert or overwrite. Only a new key moves the epoch.
    /// @return The stored value.
    template <typename K, typename U>
    V& set(const K& key, U&& value) {
        return set_canonical(policy_(key), std::forward<U>(value));
    }

    /// Access or create (value-initialized) by key.
    template <typename K>
    V& operator[](const K& key) {
        std::string k = policy_(key);
        auto it = store_.find(k);
        if (it != store_.end()) return it->second;
        return set_canonical(std::move(k), V{});
    }

    /// @brief Shared reference to the stored value, nullptr if absent.
    template <typename K>
    [[nodiscard]] V* find(const K& key) {
        auto it = store_.find(policy_(key));
        return it != store_.end() ? &it->second : nullptr;
    }

    template <typename K>
    [[nodiscard]] const V* find(const K& key) const {
        auto it = store_.find(policy_(key));
        return it != store_.end() ? &it->second : nullptr;
    }

    /// @brief Copy of the stored value, std::nullopt if absent.
    template <typename K>
    [[nodiscard]] std::optional<V> get(const K& key) const {
        const V* p = find(key);
        if (!p) return std::nullopt;
        return *p;
    }

    /// @brief Stored value, or default_value if absent. Never throws on a miss.
    template <typename K>
    [[nodiscard]] V get_or(const K& key, V default_value) const {
        const V* p = find(key);
        return p ? *p : std::move(default_value);
    }

    /// @brief Checked access.
    /// @throws OutOfRangeError if the key is absent.
    template <typename K>
    [[nodiscard]] V& at(const K& key) {
        V* p = find(key);
        if (ORDMAP_UNLIKELY(!p)) throw_missing(key);
        return *p;
    }

    template <typename K>
    [[nodiscard]] const V& at(const K& key) const {
        const V* p = find(key);
        if (ORDMAP_UNLIKELY(!p)) throw_missing(key);
        return *p;
    }

    template <typename K>
    [[nodiscard]] bool has(const K& key) const {
        return store_.find(policy_(key)) != store_.end();
    }

    template <typename K>
    [[nodiscard]] bool contains(const K& key) const { return has(key); }

    /// @brief Whether any live key maps to value. O(n).
    template <typename U, typename Eq = DefaultEquals>
    [[nodiscard]] bool contains_value(const U& value, Eq eq = Eq{}) const {
        for (const auto& [k, v] : store_) {
            if (eq(v, value)) return true;
        }
        return false;
    }

    /// @brief Remove a key. Compacts the ledger once it is more than
    /// ORDMAP_COMPACTION_FACTOR times the live count.
    /// @return false if the key was absent (nothing changes).
    template <typename K>
    bool erase(const K& key) {
        auto it = store_.find(policy_(key));
        if (it == store_.end()) return false;
        store_.erase(it);
        ++epoch_;
        if (order_.size() > ORDMAP_COMPACTION_FACTOR * store_.size()) compact();
        return true;
    }

    /// @brief Remove everything. The epoch restarts at zero; outstanding
    /// iterators fail on their next advance.
    void clear() noexcept {
        store_.clear();
        order_.clear();
        epoch_ = 0;
        ++generation_;
    }

    // ─── Order ledger ───────────────────────────────────────────────────

    /// @brief Drop stale and duplicate keys from the ledger.
    ///
    /// Afterwards ledger().size() == size() and every live key appears once,
    /// at its first surviving position. Does not move the epoch. Idempotent.
    void compact() const {
        if (ORDMAP_LIKELY(order_.size() == store_.size())) return;
        compact_slow();
    }

    /// @brief Live keys in ledger order.
    [[nodiscard]] std::vector<std::string> keys() const {
        compact();
        return std::vector<std::string>(order_.begin(), order_.end());
    }

    /// @brief Values in ledger order.
    [[nodiscard]] std::vector<V> values() const {
        compact();
        std::vector<V> out;
        out.reserve(order_.size());
        for (const auto& k : order_) out.push_back(store_.find(k)->second);
        return out;
    }

    // ─── Iteration ──────────────────────────────────────────────────────

    [[nodiscard]] key_iterator_type key_iterator() const { return key_iterator_type(*this); }
    [[nodiscard]] value_iterator_type value_iterator() const { return value_iterator_type(*this); }
    [[nodiscard]] entry_iterator_type entry_iterator() const { return entry_iterator_type(*this); }

    /// @brief Call fn(value, key, map) for each live key in ledger order.
    ///
    /// Not epoch-checked. A callback that erases keys sees them skipped;
    /// keys it adds are visited too.
    template <typename Fn>
    void for_each(Fn&& fn) {
        compact();
        for (size_type i = 0; i < order_.size(); ++i) {
            const std::string key = order_[i];
            auto it = store_.find(key);
            if (it == store_.end()) continue;
            fn(it->second, key, *this);
        }
    }

    template <typename Fn>
    void for_each(Fn&& fn) const {
        compact();
        for (size_type i = 0; i < order_.size(); ++i) {
            const std::string& key = order_[i];
            fn(store_.find(key)->second, key, *this);
        }
    }

    // ─── Derived operations ─────────────────────────────────────────────

    /// @brief Same live keys with eq-equal values. Order is not compared.
    template <typename W, typename Eq = DefaultEquals>
    [[nodiscard]] bool equals(const OrderedMap<W, KeyPolicy>& other, Eq eq = Eq{}) const {
        if (static_cast<const void*>(this) == static_cast<const void*>(&other)) return true;
        if (size() != other.size()) return false;
        compact();
        for (const auto& k : order_) {
            auto theirs = other.store_.find(k);
            if (theirs == other.store_.end()) return false;
            if (!eq(store_.find(k)->second, theirs->second)) return false;
        }
        return true;
    }

    bool operator==(const OrderedMap& other) const { return equals(other); }
    bool operator!=(const OrderedMap& other) const { return !equals(other); }

    /// @brief Swap keys and values: each value becomes a canonical key
    /// mapped to its former key.
    ///
    /// When several keys share a value, which of them the result keeps is
    /// implementation-defined (currently the last one in ledger order) and
    /// may change after a compaction.
    [[nodiscard]] OrderedMap<std::string, KeyPolicy> transpose() const {
        compact();
        OrderedMap<std::string, KeyPolicy> out(resource());
        for (const auto& k : order_) out.set(store_.find(k)->second, k);
        return out;
    }

    /// @brief Export to a flat association (no order).
    [[nodiscard]] FlatObject<V> to_object() const {
        compact();
        FlatObject<V> out;
        out.reserve(order_.size());
        for (const auto& k : order_) out.emplace(k, store_.find(k)->second);
        return out;
    }

    /// @brief set() every pair of another map, in its ledger order.
    template <typename W, typename P>
    void add_all(const OrderedMap<W, P>& other) {
        if (static_cast<const void*>(this) == static_cast<const void*>(&other)) return;
        other.compact();
        for (const auto& k : other.order_) {
            const W& value = other.store_.find(k)->second;
            if constexpr (std::is_same_v<P, KeyPolicy>) {
                set_canonical(k, value);
            } else {
                set(k, value);
            }
        }
    }

    /// @brief set() every pair of a generic association, in its iteration order.
    template <typename Assoc,
              std::enable_if_t<detail::is_association_v<Assoc>, int> = 0>
    void add_all(const Assoc& assoc) {
        for (const auto& entry : assoc) set(entry.first, entry.second);
    }

    /// Swap contents. Outstanding iterators on either map fail afterwards.
    void swap(OrderedMap& other) {
        if (this == &other) return;
        if (resource() == other.resource()) {
            store_.swap(other.store_);
            order_.swap(other.order_);
            std::swap(epoch_, other.epoch_);
            ++generation_;
            ++other.generation_;
        } else {
            OrderedMap mine(*this, other.resource());
            OrderedMap theirs(other, resource());
            *this = std::move(theirs);
            other = std::move(mine);
        }
    }

private:
    template <typename, typename> friend class OrderedMap;
    template <typename> friend class detail::EpochCursor;

    store_type store_;
    mutable ledger_type order_;
    epoch_type epoch_ = 0;
    epoch_type generation_ = 0;
    key_policy policy_{};

    ORDMAP_NOINLINE void compact_slow() const {
        // Filter pass: keep live keys, in place.
        auto live_end = order_.begin();
        for (auto in = order_.begin(); in != order_.end(); ++in) {
            if (store_.find(*in) == store_.end()) continue;
            if (live_end != in) *live_end = std::move(*in);
            ++live_end;
        }
        order_.erase(live_end, order_.end());

        if (order_.size() != store_.size()) {
            // Still too long: a key was erased and re-added while its old
            // ledger entry survived. Keep the first occurrence.
            std::pmr::unordered_set<std::string_view,
                                    detail::StringHash,
                                    detail::StringEqual> seen(
                store_.size(), detail::StringHash{}, detail::StringEqual{},
                order_.get_allocator().resource());
            auto out = order_.begin();
            for (auto in = order_.begin(); in != order_.end(); ++in) {
                if (seen.count(std::string_view(*in))) continue;
                if (out != in) *out = std::move(*in);
                seen.insert(std::string_view(*out));
                ++out;
            }
            order_.erase(out, order_.end());
        }
    }

    template <typename U>
    V& set_canonical(std::string key, U&& value) {
        auto it = store_.find(key);
        if (it != store_.end()) {
            it->second = std::forward<U>(value);
            return it->second;
        }
        // Store first: a throwing value constructor leaves both untouched.
        auto slot = store_.emplace(std::move(key), std::forward<U>(value)).first;
        try {
            order_.push_back(slot->first);
        } catch (...) {
            store_.erase(slot);
            throw;
        }
        ++epoch_;
        return slot->second;
    }

    template <typename K, typename U, typename... Rest>
    void set_pairs(K&& key, U&& value, Rest&&... rest) {
        set(key, std::forward<U>(value));
        if constexpr (sizeof...(Rest) > 0) set_pairs(std::forward<Rest>(rest)...);
    }

    void reset_moved_from() noexcept {
        store_.clear();
        order_.clear();
        epoch_ = 0;
        ++generation_;
    }

    template <typename K>
    [[noreturn]] void throw_missing(const K& key) const {
        throw OutOfRangeError("key not found: \"" + policy_(key) + "\"");
    }
};

template <typename V, typename P>
void swap(OrderedMap<V, P>& a, OrderedMap<V, P>& b) { a.swap(b); }

} // namespace ordmap
