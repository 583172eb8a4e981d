/**
 * @file Container.cpp
 * @brief Container storage, path navigation, deep copy and equality
 */

#include "stratum/Container.hpp"
#include "stratum/Codec.hpp"
#include "stratum/Log.hpp"

#include <set>
#include <type_traits>
#include <unordered_set>

namespace stratum {

namespace {

// ============================================================================
// Path resolution
// ============================================================================

Path parse_top_level(const std::string& path) {
    if (path.empty()) {
        throw InvalidArgumentError("path", "path must not be empty");
    }
    Path segments = parse_path(path);
    if (segments.front().is_accessor()) {
        throw InvalidArgumentError("path", "relative path '" + path +
                                   "' must be joined to an enclosing path first");
    }
    return segments;
}

bool has_accessor_at(const Path& segments, std::size_t i) {
    return i < segments.size() && segments[i].is_accessor();
}

/**
 * Walk segments from root. On failure returns nullopt and stores the index
 * of the first segment that did not resolve in failed_at.
 */
std::optional<Value> resolve(const Container& root, const Path& segments,
                             std::size_t* failed_at) {
    auto fail = [failed_at](std::size_t at) -> std::optional<Value> {
        if (failed_at) *failed_at = at;
        return std::nullopt;
    };

    const Container* current = &root;
    std::size_t i = 0;
    while (i < segments.size()) {
        const Segment& property = segments[i];
        const Value* stored = current->find(property.name);
        if (!stored) {
            return fail(i);
        }

        if (!has_accessor_at(segments, i + 1)) {
            if (i + 1 == segments.size()) {
                return *stored;
            }
            const auto* child = std::get_if<ContainerPtr>(stored);
            if (!child || !*child) {
                return fail(i + 1);
            }
            current = child->get();
            ++i;
            continue;
        }

        const Segment& accessor = segments[i + 1];
        ContainerPtr element;
        if (accessor.kind == SegmentKind::ListIndex) {
            const auto* list = std::get_if<ContainerList>(stored);
            if (!list || accessor.index >= list->size()) {
                return fail(i + 1);
            }
            element = (*list)[accessor.index];
        } else {
            const auto* map = std::get_if<ContainerMap>(stored);
            const ContainerPtr* found = map ? map->find(accessor.name) : nullptr;
            if (!found) {
                return fail(i + 1);
            }
            element = *found;
        }

        if (i + 2 == segments.size()) {
            return Value(element);
        }
        if (!element) {
            return fail(i + 2);
        }
        current = element.get();
        i += 2;
    }
    return fail(0);
}

// ============================================================================
// Deep copy
// ============================================================================

struct CopyState {
    std::unordered_set<const Container*> active;
};

ContainerPtr copy_container(const Container& source, CopyState& state);

// nullopt when the value is a reference back into the copy in progress
std::optional<ContainerPtr> copy_child(const ContainerPtr& child, CopyState& state) {
    if (!child) {
        return ContainerPtr();
    }
    if (state.active.count(child.get()) > 0) {
        logger()->warn("Container::deep_copy: cycle detected; back-reference dropped");
        return std::nullopt;
    }
    return copy_container(*child, state);
}

std::optional<Value> copy_inner(const Value& value, CopyState& state) {
    return std::visit([&state, &value](const auto& stored) -> std::optional<Value> {
        using T = std::decay_t<decltype(stored)>;
        if constexpr (std::is_same_v<T, ContainerPtr>) {
            auto copied = copy_child(stored, state);
            if (!copied) return std::nullopt;
            return Value(std::move(*copied));
        } else if constexpr (std::is_same_v<T, ContainerList>) {
            ContainerList list;
            list.reserve(stored.size());
            for (const auto& item : stored) {
                list.push_back(copy_child(item, state).value_or(std::make_shared<Container>()));
            }
            return Value(std::move(list));
        } else if constexpr (std::is_same_v<T, ContainerMap>) {
            ContainerMap map;
            for (const auto& [key, item] : stored) {
                map.set(key, copy_child(item, state).value_or(std::make_shared<Container>()));
            }
            return Value(std::move(map));
        } else {
            return value;
        }
    }, value);
}

ContainerPtr copy_container(const Container& source, CopyState& state) {
    state.active.insert(&source);
    auto copy = std::make_shared<Container>();
    for (const auto& [key, value] : source.entries()) {
        auto copied = copy_inner(value, state);
        if (copied) {
            copy->set(key, std::move(*copied));
        }
    }
    state.active.erase(&source);
    return copy;
}

// ============================================================================
// Equality
// ============================================================================

struct EqualState {
    // Pairs under comparison; meeting one again is treated as equal
    std::set<std::pair<const Container*, const Container*>> visiting;
};

bool equal_containers(const Container& a, const Container& b, EqualState& state);

bool equal_children(const ContainerPtr& a, const ContainerPtr& b, EqualState& state) {
    if (!a || !b) return !a && !b;
    return equal_containers(*a, *b, state);
}

bool equal_values(const Value& a, const Value& b, EqualState& state) {
    if (a.index() != b.index()) {
        return false;
    }
    return std::visit([&b, &state](const auto& left) -> bool {
        using T = std::decay_t<decltype(left)>;
        const T& right = std::get<T>(b);
        if constexpr (std::is_same_v<T, ContainerPtr>) {
            return equal_children(left, right, state);
        } else if constexpr (std::is_same_v<T, ContainerList>) {
            if (left.size() != right.size()) return false;
            for (std::size_t i = 0; i < left.size(); ++i) {
                if (!equal_children(left[i], right[i], state)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, ContainerMap>) {
            if (left.size() != right.size()) return false;
            for (const auto& [key, item] : left) {
                const ContainerPtr* other = right.find(key);
                if (!other || !equal_children(item, *other, state)) return false;
            }
            return true;
        } else if constexpr (std::is_same_v<T, std::monostate>) {
            return true;
        } else {
            return left == right;
        }
    }, a);
}

bool equal_containers(const Container& a, const Container& b, EqualState& state) {
    if (&a == &b) {
        return true;
    }
    if (!state.visiting.insert({&a, &b}).second) {
        return true;
    }
    if (a.size() != b.size()) {
        return false;
    }
    for (const auto& [key, value] : a.entries()) {
        const Value* other = b.find(key);
        if (!other || !equal_values(value, *other, state)) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

// ============================================================================
// Value helpers backed by the container traversal
// ============================================================================

bool values_equal(const Value& a, const Value& b) {
    EqualState state;
    return equal_values(a, b, state);
}

Value copy_value(const Value& value) {
    CopyState state;
    return copy_inner(value, state).value_or(Value());
}

// ============================================================================
// Direct access
// ============================================================================

const Value* Container::find_checked(const std::string& key) const {
    if (key.empty()) {
        throw InvalidArgumentError("key", "key must not be empty");
    }
    return entries_.find(key);
}

Value* Container::find_mutable(const std::string& key) {
    if (key.empty()) {
        throw InvalidArgumentError("key", "key must not be empty");
    }
    return entries_.find(key);
}

void Container::set(const std::string& key, Value value) {
    if (key.empty()) {
        throw InvalidArgumentError("key", "key must not be empty");
    }
    if (observers_.empty()) {
        entries_.set(key, std::move(value));
        return;
    }

    Value old_value;
    if (const Value* existing = entries_.find(key)) {
        old_value = *existing;
    }
    entries_.set(key, std::move(value));
    const Value new_value = *entries_.find(key);
    notify(key, old_value, new_value);
}

const Value* Container::find(const std::string& key) const {
    return entries_.find(key);
}

bool Container::contains(const std::string& key) const {
    return find_checked(key) != nullptr;
}

bool Container::remove(const std::string& key) {
    const Value* existing = find_checked(key);
    if (!existing) {
        return false;
    }
    if (observers_.empty()) {
        return entries_.remove(key);
    }

    Value old_value = *existing;
    entries_.remove(key);
    notify(key, old_value, Value());
    return true;
}

void Container::clear() {
    if (observers_.empty()) {
        entries_.clear();
        return;
    }
    for (const auto& key : keys()) {
        remove(key);
    }
}

std::vector<std::string> Container::keys() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& key : entries_.ordered_keys()) {
        out.push_back(key);
    }
    return out;
}

std::optional<std::string> Container::value_type(const std::string& key) const {
    const Value* stored = find_checked(key);
    if (!stored) {
        return std::nullopt;
    }
    return type_id(*stored);
}

void Container::move_entry(const std::string& key, std::size_t new_index) {
    entries_.move_entry(key, new_index);
}

void Container::report_type_mismatch(const std::string& where, const Value& stored,
                                     const char* requested) const {
    logger()->warn("Container: value at '{}' is '{}', not '{}'; returning default",
                   where, type_id(stored), requested);
}

// ============================================================================
// Get-or-create
// ============================================================================

ContainerPtr Container::get_or_create_container(const std::string& key) {
    if (Value* stored = find_mutable(key)) {
        if (auto* child = std::get_if<ContainerPtr>(stored); child && *child) {
            return *child;
        }
    }
    auto created = std::make_shared<Container>();
    set(key, created);
    return created;
}

ContainerList& Container::get_or_create_list(const std::string& key) {
    if (Value* stored = find_mutable(key)) {
        if (auto* list = std::get_if<ContainerList>(stored)) {
            return *list;
        }
    }
    set(key, ContainerList{});
    return std::get<ContainerList>(*entries_.find(key));
}

ContainerMap& Container::get_or_create_map(const std::string& key) {
    if (Value* stored = find_mutable(key)) {
        if (auto* map = std::get_if<ContainerMap>(stored)) {
            return *map;
        }
    }
    set(key, ContainerMap{});
    return std::get<ContainerMap>(*entries_.find(key));
}

// ============================================================================
// Path access
// ============================================================================

std::optional<Value> Container::path_find(const std::string& path) const {
    return resolve(*this, parse_top_level(path), nullptr);
}

bool Container::path_contains(const std::string& path) const {
    return path_find(path).has_value();
}

Value Container::path_value(const std::string& path) const {
    const Path segments = parse_top_level(path);
    std::size_t failed_at = 0;
    auto found = resolve(*this, segments, &failed_at);
    if (!found) {
        throw PathNavigationError(path, to_string(segments[failed_at]));
    }
    return std::move(*found);
}

void Container::path_set(const std::string& path, Value value) {
    const Path segments = parse_top_level(path);

    if (segments.back().is_accessor()) {
        const auto* element = std::get_if<ContainerPtr>(&value);
        if (!element) {
            throw PathTypeError(path, ValueTraits<ContainerPtr>::type_id, type_id(value));
        }
        if (!*element) {
            throw InvalidArgumentError("value", "cannot store a null container at '" + path + "'");
        }
    }

    Container* current = this;
    ContainerPtr holder;
    std::size_t i = 0;
    while (i < segments.size()) {
        const Segment& property = segments[i];

        if (!has_accessor_at(segments, i + 1)) {
            if (i + 1 == segments.size()) {
                current->set(property.name, std::move(value));
                return;
            }
            holder = current->get_or_create_container(property.name);
            current = holder.get();
            ++i;
            continue;
        }

        const Segment& accessor = segments[i + 1];
        const bool terminal = i + 2 == segments.size();
        ContainerPtr replacement = terminal ? std::get<ContainerPtr>(std::move(value)) : nullptr;
        if (accessor.kind == SegmentKind::ListIndex) {
            if (accessor.index > kMaxListAutoGrowIndex) {
                const Value* stored = current->find(property.name);
                const auto* list = stored ? std::get_if<ContainerList>(stored) : nullptr;
                if (!list || accessor.index >= list->size()) {
                    throw PathNavigationError(path, to_string(accessor));
                }
            }
            holder = current->list_element(property.name, accessor.index, std::move(replacement));
        } else {
            holder = current->map_element(property.name, accessor.name, std::move(replacement));
        }

        if (terminal) {
            return;
        }
        current = holder.get();
        i += 2;
    }
}

bool Container::path_remove(const std::string& path) {
    const Path segments = parse_top_level(path);
    const bool ends_with_accessor = segments.back().is_accessor();
    const std::size_t property_index = segments.size() - (ends_with_accessor ? 2 : 1);

    Container* owner = this;
    ContainerPtr owner_holder;
    if (property_index > 0) {
        const Path prefix(segments.begin(), segments.begin() + static_cast<std::ptrdiff_t>(property_index));
        auto parent = resolve(*this, prefix, nullptr);
        if (!parent) {
            return false;
        }
        auto* child = std::get_if<ContainerPtr>(&*parent);
        if (!child || !*child) {
            return false;
        }
        owner_holder = *child;
        owner = owner_holder.get();
    }

    const Segment& property = segments[property_index];
    if (!ends_with_accessor) {
        return owner->remove(property.name);
    }

    Value* stored = owner->find_mutable(property.name);
    if (!stored) {
        return false;
    }
    const Segment& accessor = segments.back();
    if (accessor.kind == SegmentKind::ListIndex) {
        auto* list = std::get_if<ContainerList>(stored);
        if (!list || accessor.index >= list->size()) {
            return false;
        }
        const auto position = static_cast<std::ptrdiff_t>(accessor.index);
        if (owner->observers_.empty()) {
            list->erase(list->begin() + position);
        } else {
            ContainerList updated = *list;
            updated.erase(updated.begin() + position);
            owner->set(property.name, Value(std::move(updated)));
        }
        return true;
    }

    auto* map = std::get_if<ContainerMap>(stored);
    if (!map || !map->contains_key(accessor.name)) {
        return false;
    }
    if (owner->observers_.empty()) {
        map->remove(accessor.name);
    } else {
        ContainerMap updated = *map;
        updated.remove(accessor.name);
        owner->set(property.name, Value(std::move(updated)));
    }
    return true;
}

ContainerPtr Container::list_element(const std::string& key, std::size_t index,
                                     ContainerPtr replacement) {
    Value* stored = find_mutable(key);
    ContainerList* list = stored ? std::get_if<ContainerList>(stored) : nullptr;
    if (list && index < list->size()) {
        const ContainerPtr& slot = (*list)[index];
        if (slot && (!replacement || replacement == slot)) {
            return slot;
        }
    }

    auto fill = [index, &replacement](ContainerList& target) -> ContainerPtr {
        while (target.size() <= index) {
            target.push_back(std::make_shared<Container>());
        }
        ContainerPtr& slot = target[index];
        if (replacement) {
            slot = std::move(replacement);
        } else if (!slot) {
            slot = std::make_shared<Container>();
        }
        return slot;
    };

    if (list && observers_.empty()) {
        return fill(*list);
    }
    ContainerList updated = list ? *list : ContainerList{};
    ContainerPtr element = fill(updated);
    set(key, Value(std::move(updated)));
    return element;
}

ContainerPtr Container::map_element(const std::string& key, const std::string& item_key,
                                    ContainerPtr replacement) {
    Value* stored = find_mutable(key);
    ContainerMap* map = stored ? std::get_if<ContainerMap>(stored) : nullptr;
    if (map) {
        const ContainerPtr* slot = map->find(item_key);
        if (slot && *slot && (!replacement || replacement == *slot)) {
            return *slot;
        }
    }

    auto fill = [&item_key, &replacement](ContainerMap& target) -> ContainerPtr {
        ContainerPtr element = std::move(replacement);
        if (!element) {
            const ContainerPtr* slot = target.find(item_key);
            element = (slot && *slot) ? *slot : std::make_shared<Container>();
        }
        target.set(item_key, element);
        return element;
    };

    if (map && observers_.empty()) {
        return fill(*map);
    }
    ContainerMap updated = map ? *map : ContainerMap{};
    ContainerPtr element = fill(updated);
    set(key, Value(std::move(updated)));
    return element;
}

// ============================================================================
// Copy, equality, serialization
// ============================================================================

ContainerPtr Container::deep_copy() const {
    CopyState state;
    return copy_container(*this, state);
}

bool Container::equals(const Container& other) const {
    EqualState state;
    return equal_containers(*this, other, state);
}

std::string Container::to_wire_format() const {
    return encode_container(*this);
}

ContainerPtr Container::from_wire_format(const std::string& text) {
    return decode_container(text);
}

nlohmann::ordered_json Container::to_plain_json() const {
    return stratum::to_plain_json(*this);
}

// ============================================================================
// Observers
// ============================================================================

Container::ObserverId Container::add_observer(Observer observer) {
    const ObserverId id = next_observer_id_++;
    observers_.emplace_back(id, std::move(observer));
    return id;
}

bool Container::remove_observer(ObserverId id) {
    for (auto it = observers_.begin(); it != observers_.end(); ++it) {
        if (it->first == id) {
            observers_.erase(it);
            return true;
        }
    }
    return false;
}

void Container::notify(const std::string& key, const Value& old_value,
                       const Value& new_value) const {
    // Snapshot: callbacks may add or remove observers while we dispatch
    const auto snapshot = observers_;
    for (const auto& [id, observer] : snapshot) {
        if (observer) {
            observer(key, old_value, new_value);
        }
    }
}

} // namespace stratum
