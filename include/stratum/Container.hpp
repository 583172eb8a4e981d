/**
 * @file Container.hpp
 * @brief Mutable, path-addressable store of typed values
 *
 * A Container maps string keys to Values. Keys keep their insertion
 * position for display; re-setting a key replaces its type and value in
 * place. Containers nest through three value kinds:
 * - ContainerPtr   ("stats")
 * - ContainerList  ("items[2]")
 * - ContainerMap   ("slots[\"head\"]")
 *
 * Reads are forgiving: a missing key or path yields the caller's fallback
 * and a stored value of another type yields the fallback plus a warning.
 * Writes are strict: empty keys, relative paths, and non-Container values
 * at a list/map terminal raise exceptions.
 *
 * Examples:
 * ```cpp
 * Container c;
 * c.set("name", "goblin");
 * c.path_set("stats.hp", 30);            // creates "stats"
 * c.path_set("loot[2]", std::make_shared<Container>());  // pads loot[0], loot[1]
 * int hp = c.path_get<std::int32_t>("stats.hp", 0);       // 30
 * double bad = c.get<double>("name", 1.0);                // 1.0, logs a warning
 * ```
 *
 * Not thread-safe. Observers are called synchronously whenever the value
 * stored under a top-level key changes: set(), remove(), clear(), and
 * path_set()/path_remove() calls that grow, fill or shrink a top-level
 * list or map. Edits inside nested containers are not reported.
 */

#ifndef STRATUM_CONTAINER_HPP
#define STRATUM_CONTAINER_HPP

#include "stratum/Errors.hpp"
#include "stratum/OrderedMap.hpp"
#include "stratum/Path.hpp"
#include "stratum/Value.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stratum {

/// Largest list index path_set() will pad a list up to
inline constexpr std::size_t kMaxListAutoGrowIndex = 65535;

class Container {
public:
    using Entries = OrderedMap<std::string, Value>;
    using ObserverId = std::size_t;

    /**
     * @brief Change callback: (key, old value, new value)
     *
     * A value that did not exist (or no longer exists) is reported as null.
     */
    using Observer = std::function<void(const std::string&, const Value&, const Value&)>;

    Container() = default;

    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;
    Container(Container&&) = default;
    Container& operator=(Container&&) = default;

    // ========================================================================
    // Direct access
    // ========================================================================

    /**
     * @brief Insert or replace a value
     * @throws InvalidArgumentError if key is empty
     */
    void set(const std::string& key, Value value);

    /// String literal overload (avoids the const char* -> bool conversion)
    void set(const std::string& key, const char* value) {
        set(key, Value(std::string(value)));
    }

    /**
     * @brief Typed read
     *
     * Missing key returns fallback silently; a value of another type
     * returns fallback and logs a warning.
     *
     * @throws InvalidArgumentError if key is empty
     */
    template <typename T>
    T get(const std::string& key, const T& fallback = T{}) const {
        static_assert(is_value_type_v<T>, "T must be one of the Value alternatives");
        const Value* stored = find_checked(key);
        if (!stored) {
            return fallback;
        }
        if (const T* typed = std::get_if<T>(stored)) {
            return *typed;
        }
        report_type_mismatch(key, *stored, ValueTraits<T>::type_id);
        return fallback;
    }

    /**
     * @brief Typed read without a fallback
     * @return std::nullopt if the key is missing or holds another type
     * @throws InvalidArgumentError if key is empty
     */
    template <typename T>
    std::optional<T> try_get(const std::string& key) const {
        static_assert(is_value_type_v<T>, "T must be one of the Value alternatives");
        const Value* stored = find_checked(key);
        if (!stored) {
            return std::nullopt;
        }
        if (const T* typed = std::get_if<T>(stored)) {
            return *typed;
        }
        return std::nullopt;
    }

    /// Stored value or nullptr; the pointer is invalidated by mutation of the key
    const Value* find(const std::string& key) const;

    bool contains(const std::string& key) const;

    /**
     * @brief Remove a key
     * @return true if the key existed
     */
    bool remove(const std::string& key);

    /// Remove every key (observers are notified per key)
    void clear();

    /// Snapshot of the keys in display order
    std::vector<std::string> keys() const;

    /// Type id of the stored value, std::nullopt if the key is absent
    std::optional<std::string> value_type(const std::string& key) const;

    std::size_t size() const noexcept { return entries_.size(); }
    bool empty() const noexcept { return entries_.empty(); }

    /**
     * @brief Move a key to a new display position
     * @throws std::out_of_range if the key is absent or new_index >= size()
     */
    void move_entry(const std::string& key, std::size_t new_index);

    /// Entries in display order
    const Entries& entries() const noexcept { return entries_; }

    // ========================================================================
    // Get-or-create
    // ========================================================================

    /**
     * @brief Nested container at key, created (or replacing a value of
     *        another kind) when needed
     */
    ContainerPtr get_or_create_container(const std::string& key);

    /**
     * @brief Container list at key, created when needed
     *
     * The reference stays valid until the key is set or removed.
     */
    ContainerList& get_or_create_list(const std::string& key);

    /**
     * @brief Container map at key, created when needed
     *
     * The reference stays valid until the key is set or removed.
     */
    ContainerMap& get_or_create_map(const std::string& key);

    // ========================================================================
    // Path access
    // ========================================================================

    /**
     * @brief Typed read by path
     *
     * Unresolvable paths return fallback; a value of another type returns
     * fallback and logs a warning.
     *
     * @throws InvalidArgumentError on an empty or relative path
     * @throws PathSyntaxError on malformed path text
     */
    template <typename T>
    T path_get(const std::string& path, const T& fallback = T{}) const {
        static_assert(is_value_type_v<T>, "T must be one of the Value alternatives");
        auto stored = path_find(path);
        if (!stored) {
            return fallback;
        }
        if (T* typed = std::get_if<T>(&*stored)) {
            return std::move(*typed);
        }
        report_type_mismatch(path, *stored, ValueTraits<T>::type_id);
        return fallback;
    }

    /**
     * @brief Value at path, std::nullopt if any segment does not resolve
     *
     * Nested containers in the result are shared with this container.
     *
     * @throws InvalidArgumentError on an empty or relative path
     * @throws PathSyntaxError on malformed path text
     */
    std::optional<Value> path_find(const std::string& path) const;

    /// True if path_find() would return a value
    bool path_contains(const std::string& path) const;

    /**
     * @brief Strict lookup
     * @throws PathNavigationError naming the first segment that does not resolve
     */
    Value path_value(const std::string& path) const;

    /**
     * @brief Write a value by path
     *
     * Intermediate property segments are fetched or created as containers.
     * List segments are padded with new empty containers up to the index;
     * missing map keys get a new empty container. Only containers can be
     * written at a list or map terminal.
     *
     * @throws InvalidArgumentError on an empty or relative path, or a null
     *         container at a list/map terminal
     * @throws PathSyntaxError on malformed path text
     * @throws PathTypeError for a non-container value at a list/map terminal
     * @throws PathNavigationError when a list would have to grow past
     *         kMaxListAutoGrowIndex
     */
    void path_set(const std::string& path, Value value);

    void path_set(const std::string& path, const char* value) {
        path_set(path, Value(std::string(value)));
    }

    /**
     * @brief Remove the property, list element or map entry at path
     *
     * Removing a list element shifts the following elements down.
     *
     * @return true if something was removed
     */
    bool path_remove(const std::string& path);

    // ========================================================================
    // Copy, equality, serialization
    // ========================================================================

    /**
     * @brief Full structural copy
     *
     * Nested containers, list elements and map values are copied
     * recursively. A reference back to a container that is still being
     * copied is dropped with a warning (omitted key, or an empty container
     * for a collection slot).
     */
    ContainerPtr deep_copy() const;

    /// Deep structural equality: same keys, same types, equal values
    bool equals(const Container& other) const;

    /// Compact wire document (see Codec.hpp)
    std::string to_wire_format() const;

    /// Decode a wire document; malformed input degrades to what is recoverable
    static ContainerPtr from_wire_format(const std::string& text);

    /// Readable JSON export in display order
    nlohmann::ordered_json to_plain_json() const;

    // ========================================================================
    // Observers
    // ========================================================================

    /**
     * @brief Register a change callback
     *
     * Callbacks run in registration order. A callback may remove itself
     * (or others) while being dispatched; the current dispatch still uses
     * the list taken before it started.
     */
    ObserverId add_observer(Observer observer);

    /// @return false if the id is not registered
    bool remove_observer(ObserverId id);

    std::size_t observer_count() const noexcept { return observers_.size(); }

private:
    Entries entries_;
    std::vector<std::pair<ObserverId, Observer>> observers_;
    ObserverId next_observer_id_ = 1;

    const Value* find_checked(const std::string& key) const;
    Value* find_mutable(const std::string& key);

    void notify(const std::string& key, const Value& old_value, const Value& new_value) const;

    // Element of the list/map at key, padded or created as needed. A
    // non-null replacement is stored in the slot. Observers see the
    // collection change as a set() of key.
    ContainerPtr list_element(const std::string& key, std::size_t index, ContainerPtr replacement);
    ContainerPtr map_element(const std::string& key, const std::string& item_key,
                             ContainerPtr replacement);

    void report_type_mismatch(const std::string& where, const Value& stored,
                              const char* requested) const;
};

} // namespace stratum

#endif // STRATUM_CONTAINER_HPP
