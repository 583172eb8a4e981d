/**
 * @file Diff.hpp
 * @brief Override entries and the container diff that produces them
 *
 * An override records one deviation of an instance from its template as
 * a (path, type id, serialized value) triple. diff_containers() walks the
 * modified container against the base and emits one override per
 * deviating leaf:
 * - a key only present on the modified side
 * - a key whose stored type differs
 * - a nested container: recurse
 * - a container list or map: see CollectionDiff
 * - any other value: compared by value equality
 *
 * Keys only present in the base produce nothing; an override can add or
 * replace a value, never delete one.
 */

#ifndef STRATUM_DIFF_HPP
#define STRATUM_DIFF_HPP

#include "stratum/Value.hpp"

#include <string>
#include <vector>

namespace stratum {

struct OverrideEntry {
    std::string path;
    std::string type;   ///< Type id of the stored value
    std::string value;  ///< Payload from serialize_value()

    bool operator==(const OverrideEntry& other) const {
        return path == other.path && type == other.type && value == other.value;
    }
    bool operator!=(const OverrideEntry& other) const { return !(*this == other); }
};

/**
 * @brief How container lists and maps are compared
 */
enum class CollectionDiff {
    /**
     * Lists of equal length recurse per element ("items[2].hp"); maps with
     * the same key set recurse per key ("slots[\"head\"].id"). Any other
     * difference overrides the whole collection.
     */
    Structural,
    /**
     * Collections are equal only if they hold the very same element
     * objects. A freshly deep-copied collection therefore always shows up
     * as a whole-collection override.
     */
    Identity
};

struct DiffOptions {
    CollectionDiff collections = CollectionDiff::Structural;
};

/// Build an override entry for a value
OverrideEntry make_override(const std::string& path, const Value& value);

/**
 * @brief Overrides that turn base into modified
 *
 * Entries come out depth-first in the modified container's display order.
 */
std::vector<OverrideEntry> diff_containers(const Container& base,
                                           const Container& modified,
                                           const DiffOptions& options = {});

std::string to_string(CollectionDiff mode);

/// "structural" / "identity" (case-insensitive); false on unknown names
bool parse_collection_diff(const std::string& name, CollectionDiff& out);

} // namespace stratum

#endif // STRATUM_DIFF_HPP
