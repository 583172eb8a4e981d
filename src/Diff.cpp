/**
 * @file Diff.cpp
 * @brief Structural diff of two containers into override entries
 */

#include "stratum/Diff.hpp"
#include "stratum/Codec.hpp"
#include "stratum/Container.hpp"
#include "stratum/Log.hpp"
#include "stratum/Path.hpp"
#include "stratum/Util.hpp"

#include <set>
#include <utility>

namespace stratum {

namespace {

class Differ {
public:
    explicit Differ(const DiffOptions& options) : options_(options) {}

    std::vector<OverrideEntry> run(const Container& base, const Container& modified) {
        walk(base, modified, "");
        return std::move(entries_);
    }

private:
    const DiffOptions& options_;
    std::vector<OverrideEntry> entries_;
    std::set<std::pair<const Container*, const Container*>> visiting_;

    void emit(const std::string& path, const Value& value) {
        entries_.push_back(make_override(path, value));
    }

    void walk(const Container& base, const Container& modified, const std::string& prefix) {
        if (!visiting_.insert({&base, &modified}).second) {
            logger()->warn("diff: cycle detected below '{}'; not descending again", prefix);
            return;
        }
        for (const auto& [key, value] : modified.entries()) {
            const std::string path = combine_path(prefix, key);
            const Value* original = base.find(key);
            if (!original || original->index() != value.index() ||
                type_id(*original) != type_id(value)) {
                emit(path, value);
                continue;
            }
            compare(*original, value, path);
        }
        visiting_.erase({&base, &modified});
    }

    void compare(const Value& original, const Value& value, const std::string& path) {
        if (const auto* child = std::get_if<ContainerPtr>(&value)) {
            const auto& base_child = std::get<ContainerPtr>(original);
            if (*child && base_child) {
                walk(*base_child, **child, path);
            } else if (!values_equal(original, value)) {
                emit(path, value);
            }
            return;
        }
        if (const auto* list = std::get_if<ContainerList>(&value)) {
            compare_list(std::get<ContainerList>(original), *list, path);
            return;
        }
        if (const auto* map = std::get_if<ContainerMap>(&value)) {
            compare_map(std::get<ContainerMap>(original), *map, path);
            return;
        }
        if (!values_equal(original, value)) {
            emit(path, value);
        }
    }

    void compare_list(const ContainerList& original, const ContainerList& list,
                      const std::string& path) {
        if (original.size() != list.size()) {
            emit(path, list);
            return;
        }
        if (options_.collections == CollectionDiff::Identity) {
            for (std::size_t i = 0; i < list.size(); ++i) {
                if (original[i] != list[i]) {
                    emit(path, list);
                    return;
                }
            }
            return;
        }
        for (std::size_t i = 0; i < list.size(); ++i) {
            if (!original[i] || !list[i]) {
                if (original[i] != list[i]) {
                    emit(path, list);
                    return;
                }
            }
        }
        for (std::size_t i = 0; i < list.size(); ++i) {
            if (list[i]) {
                walk(*original[i], *list[i], combine_list_item_path(path, i));
            }
        }
    }

    void compare_map(const ContainerMap& original, const ContainerMap& map,
                     const std::string& path) {
        bool same_keys = original.size() == map.size();
        for (const auto& [key, item] : map) {
            if (!same_keys) break;
            const ContainerPtr* other = original.find(key);
            same_keys = other != nullptr;
        }
        if (!same_keys) {
            emit(path, map);
            return;
        }

        if (options_.collections == CollectionDiff::Identity) {
            for (const auto& [key, item] : map) {
                if (*original.find(key) != item) {
                    emit(path, map);
                    return;
                }
            }
            return;
        }
        for (const auto& [key, item] : map) {
            const ContainerPtr& other = *original.find(key);
            if ((!item || !other) && item != other) {
                emit(path, map);
                return;
            }
        }
        for (const auto& [key, item] : map) {
            if (item) {
                walk(**original.find(key), *item, combine_map_item_path(path, key));
            }
        }
    }
};

} // anonymous namespace

OverrideEntry make_override(const std::string& path, const Value& value) {
    return OverrideEntry{path, type_id(value), serialize_value(value)};
}

std::vector<OverrideEntry> diff_containers(const Container& base,
                                           const Container& modified,
                                           const DiffOptions& options) {
    return Differ(options).run(base, modified);
}

std::string to_string(CollectionDiff mode) {
    return mode == CollectionDiff::Identity ? "identity" : "structural";
}

bool parse_collection_diff(const std::string& name, CollectionDiff& out) {
    const std::string lowered = to_lower(trim(name));
    if (lowered == "structural") {
        out = CollectionDiff::Structural;
        return true;
    }
    if (lowered == "identity") {
        out = CollectionDiff::Identity;
        return true;
    }
    return false;
}

} // namespace stratum
