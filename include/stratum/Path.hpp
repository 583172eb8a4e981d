/**
 * @file Path.hpp
 * @brief Path grammar, parser and path-string helpers
 *
 * A path addresses a value possibly several containers deep:
 *
 *   path     := group ('.' group)*
 *   group    := ident ('[' accessor ']')?
 *   accessor := integer | '"' chars '"'
 *
 * Identifiers are any run of characters other than '.', '[' and ']'.
 * Quoted map keys may contain \" and \\ escapes. A path that starts with
 * an accessor ("[0].name") is relative to an enclosing path and is only
 * meaningful after join_relative_path(); containers reject it.
 *
 * Parsing is strict: malformed text raises PathSyntaxError, nothing is
 * skipped.
 *
 * Examples:
 * ```cpp
 * parse_path("a.b.c");                    // [Property(a), Property(b), Property(c)]
 * parse_path("items[3]");                 // [Property(items), ListIndex(3)]
 * parse_path("dict[\"k 1\"].items[2].n"); // [Property(dict), MapKey("k 1"),
 *                                         //  Property(items), ListIndex(2), Property(n)]
 * parse_path("");                         // [] (the container itself)
 * parse_path("a[x]");                     // throws PathSyntaxError
 * ```
 */

#ifndef STRATUM_PATH_HPP
#define STRATUM_PATH_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace stratum {

enum class SegmentKind {
    Property,   ///< Key lookup in the current container
    ListIndex,  ///< Index into the ContainerList named by the preceding property
    MapKey      ///< Key into the ContainerMap named by the preceding property
};

struct Segment {
    SegmentKind kind = SegmentKind::Property;
    std::string name;       ///< Property name or map key
    std::size_t index = 0;  ///< List index

    static Segment property(std::string name);
    static Segment list_index(std::size_t index);
    static Segment map_key(std::string key);

    bool is_accessor() const noexcept { return kind != SegmentKind::Property; }

    bool operator==(const Segment& other) const;
    bool operator!=(const Segment& other) const { return !(*this == other); }
};

using Path = std::vector<Segment>;

/**
 * @brief Parse a path string into segments
 *
 * Accessors are emitted as their own segment right after the property
 * they apply to.
 *
 * @throws PathSyntaxError on empty identifiers, unterminated brackets or
 *         quotes, unquoted non-integer accessors, an accessor following an
 *         accessor, or characters after ']' other than '.'
 */
Path parse_path(const std::string& path);

/**
 * @brief Parse a path string, returning std::nullopt on malformed text
 */
std::optional<Path> try_parse_path(const std::string& path);

/**
 * @brief Render segments back into canonical path text
 *
 * format_path(parse_path(p)) == p for any canonical p.
 */
std::string format_path(const Path& segments);

/// Text of a single segment ("name", "[3]" or "[\"key\"]")
std::string to_string(const Segment& segment);

/// Quote a map key for use inside brackets, escaping '"' and '\'
std::string quote_map_key(const std::string& key);

// ============================================================================
// Path-string helpers
// ============================================================================

/// "parent.key", or "key" when parent is empty
std::string combine_path(const std::string& parent, const std::string& key);

/// "parent[index]"
std::string combine_list_item_path(const std::string& parent, std::size_t index);

/// "parent[\"key\"]" with the key escaped
std::string combine_map_item_path(const std::string& parent, const std::string& key);

/**
 * @brief Path without its final segment ("a.b[2]" -> "a.b", "a" -> "")
 * @throws PathSyntaxError on malformed text
 */
std::string parent_path(const std::string& path);

/**
 * @brief Final segment as plain text: property name, list index digits,
 *        or unescaped map key
 * @throws PathSyntaxError on malformed text
 */
std::string path_key(const std::string& path);

/// True if the path parses and ends with a list index
bool is_list_index_path(const std::string& path);

/// True if the path parses and ends with a quoted map key
bool is_map_key_path(const std::string& path);

/**
 * @brief Resolve a relative path against a base path
 *
 * A relative path that starts with an accessor is appended directly
 * ("items" + "[0].hp" -> "items[0].hp"); anything else is joined with '.'.
 */
std::string join_relative_path(const std::string& base, const std::string& relative);

} // namespace stratum

#endif // STRATUM_PATH_HPP
