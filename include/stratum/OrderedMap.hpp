/**
 * @file OrderedMap.hpp
 * @brief Associative container that preserves insertion order
 *
 * Entries live in a node-based list (display order); a hash index maps each
 * key to its list node, so lookup, insert, update and remove are O(1)
 * amortized regardless of how the entries are ordered. Both structures are
 * updated together by every mutating member.
 *
 * Ordering rules:
 * - set() on a new key appends it at the end
 * - set() on an existing key updates the value in place (position kept)
 * - remove() followed by set() re-inserts at the end
 * - move_entry() relocates an entry so that it ends up at the given index
 *
 * Examples:
 * ```cpp
 * OrderedMap<std::string, int> m;
 * m.set("a", 1);
 * m.set("b", 2);
 * m.set("a", 3);      // keys: a, b
 * m.remove("a");
 * m.set("a", 4);      // keys: b, a
 * m.move_entry("a", 0); // keys: a, b
 * ```
 */

#ifndef STRATUM_ORDEREDMAP_HPP
#define STRATUM_ORDEREDMAP_HPP

#include <cstddef>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <list>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace stratum {

template <typename K, typename V, typename Hash = std::hash<K>>
class OrderedMap {
public:
    using key_type = K;
    using mapped_type = V;
    using value_type = std::pair<const K, V>;
    using size_type = std::size_t;

private:
    using list_type = std::list<value_type>;

public:
    using iterator = typename list_type::iterator;
    using const_iterator = typename list_type::const_iterator;

    /**
     * @brief Forward view over one member of each entry, in order.
     *
     * Lazy and restartable: every begin() walks the live entry list again.
     * The view is invalidated by mutations that remove the entry it points at.
     */
    template <typename Projection>
    class View {
    public:
        class Iterator {
        public:
            using iterator_category = std::forward_iterator_tag;
            using value_type = std::remove_reference_t<decltype(Projection{}(std::declval<const typename list_type::value_type&>()))>;
            using difference_type = std::ptrdiff_t;
            using pointer = const value_type*;
            using reference = const value_type&;

            Iterator() = default;
            explicit Iterator(const_iterator it) : it_(it) {}

            reference operator*() const { return Projection{}(*it_); }
            pointer operator->() const { return &Projection{}(*it_); }

            Iterator& operator++() {
                ++it_;
                return *this;
            }

            Iterator operator++(int) {
                Iterator copy = *this;
                ++it_;
                return copy;
            }

            bool operator==(const Iterator& other) const { return it_ == other.it_; }
            bool operator!=(const Iterator& other) const { return it_ != other.it_; }

        private:
            const_iterator it_;
        };

        explicit View(const list_type& entries) : entries_(&entries) {}

        Iterator begin() const { return Iterator(entries_->cbegin()); }
        Iterator end() const { return Iterator(entries_->cend()); }
        size_type size() const { return entries_->size(); }
        bool empty() const { return entries_->empty(); }

    private:
        const list_type* entries_;
    };

    struct KeyProjection {
        const K& operator()(const value_type& entry) const { return entry.first; }
    };

    struct ValueProjection {
        const V& operator()(const value_type& entry) const { return entry.second; }
    };

    using KeyView = View<KeyProjection>;
    using ValueView = View<ValueProjection>;

    OrderedMap() = default;

    OrderedMap(std::initializer_list<std::pair<K, V>> init) {
        for (const auto& [key, value] : init) {
            set(key, value);
        }
    }

    OrderedMap(const OrderedMap& other) : entries_(other.entries_) {
        rebuild_index();
    }

    OrderedMap& operator=(const OrderedMap& other) {
        if (this != &other) {
            // pair<const K, V> is not assignable; copy the nodes and swap them in
            list_type copy(other.entries_);
            entries_.swap(copy);
            rebuild_index();
        }
        return *this;
    }

    // std::list keeps node iterators valid across moves, so the index stays correct
    OrderedMap(OrderedMap&&) = default;
    OrderedMap& operator=(OrderedMap&&) = default;

    /**
     * @brief Insert or update.
     * @return true if the key was newly inserted, false if updated in place
     */
    bool set(const K& key, V value) {
        auto found = index_.find(key);
        if (found != index_.end()) {
            found->second->second = std::move(value);
            return false;
        }
        auto node = entries_.emplace(entries_.end(), key, std::move(value));
        try {
            index_.emplace(key, node);
        } catch (...) {
            entries_.erase(node);
            throw;
        }
        return true;
    }

    /**
     * @brief Insert a new key.
     * @return false (map unchanged) if the key already exists
     */
    bool insert(const K& key, V value) {
        if (contains_key(key)) {
            return false;
        }
        return set(key, std::move(value));
    }

    V* find(const K& key) {
        auto found = index_.find(key);
        return found == index_.end() ? nullptr : &found->second->second;
    }

    const V* find(const K& key) const {
        auto found = index_.find(key);
        return found == index_.end() ? nullptr : &found->second->second;
    }

    std::optional<V> get(const K& key) const {
        const V* value = find(key);
        if (!value) {
            return std::nullopt;
        }
        return *value;
    }

    /**
     * @throws std::out_of_range if the key is absent
     */
    V& at(const K& key) {
        V* value = find(key);
        if (!value) {
            throw std::out_of_range("OrderedMap: key not found");
        }
        return *value;
    }

    const V& at(const K& key) const {
        const V* value = find(key);
        if (!value) {
            throw std::out_of_range("OrderedMap: key not found");
        }
        return *value;
    }

    bool remove(const K& key) {
        auto found = index_.find(key);
        if (found == index_.end()) {
            return false;
        }
        entries_.erase(found->second);
        index_.erase(found);
        return true;
    }

    bool contains_key(const K& key) const {
        return index_.find(key) != index_.end();
    }

    size_type size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    void clear() noexcept {
        index_.clear();
        entries_.clear();
    }

    /**
     * @brief Relocate an existing entry so that it sits at new_index.
     * @throws std::out_of_range if the key is absent or new_index >= size()
     */
    void move_entry(const K& key, size_type new_index) {
        if (new_index >= entries_.size()) {
            throw std::out_of_range("OrderedMap::move_entry: index " +
                                    std::to_string(new_index) + " out of range");
        }
        auto found = index_.find(key);
        if (found == index_.end()) {
            throw std::out_of_range("OrderedMap::move_entry: key not found");
        }

        auto node = found->second;
        // Position among the remaining entries once the node is taken out
        auto target = entries_.begin();
        size_type position = 0;
        while (position < new_index) {
            if (target != node) {
                ++position;
            }
            ++target;
        }
        if (target == node) {
            ++target;
        }
        // splice keeps the node (and its iterator in the index) alive
        entries_.splice(target, entries_, node);
    }

    /**
     * @brief Position of a key in display order (linear scan).
     */
    std::optional<size_type> index_of(const K& key) const {
        auto found = index_.find(key);
        if (found == index_.end()) {
            return std::nullopt;
        }
        size_type position = 0;
        for (auto it = entries_.cbegin(); it != entries_.cend(); ++it, ++position) {
            if (it == const_iterator(found->second)) {
                return position;
            }
        }
        return std::nullopt;
    }

    const K& key_at(size_type index) const { return entry_at(index).first; }
    const V& value_at(size_type index) const { return entry_at(index).second; }

    V& value_at(size_type index) {
        return const_cast<V&>(static_cast<const OrderedMap&>(*this).value_at(index));
    }

    KeyView ordered_keys() const { return KeyView(entries_); }
    ValueView ordered_values() const { return ValueView(entries_); }

    iterator begin() noexcept { return entries_.begin(); }
    iterator end() noexcept { return entries_.end(); }
    const_iterator begin() const noexcept { return entries_.cbegin(); }
    const_iterator end() const noexcept { return entries_.cend(); }

    /// Entry-wise equality: same keys, same order, equal values.
    bool operator==(const OrderedMap& other) const {
        return entries_ == other.entries_;
    }

    bool operator!=(const OrderedMap& other) const {
        return !(*this == other);
    }

private:
    list_type entries_;
    std::unordered_map<K, iterator, Hash> index_;

    void rebuild_index() {
        index_.clear();
        index_.reserve(entries_.size());
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            index_.emplace(it->first, it);
        }
    }

    const value_type& entry_at(size_type index) const {
        if (index >= entries_.size()) {
            throw std::out_of_range("OrderedMap: index " + std::to_string(index) +
                                    " out of range");
        }
        return *std::next(entries_.cbegin(), static_cast<std::ptrdiff_t>(index));
    }
};

} // namespace stratum

#endif // STRATUM_ORDEREDMAP_HPP
