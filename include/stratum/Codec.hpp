/**
 * @file Codec.hpp
 * @brief Type-tagged value codec and the container wire format
 *
 * Every value is paired with its type id and encoded into a string
 * payload. A container encodes to a document with two parallel maps:
 *
 * ```json
 * {"data":{"hp":"100","stats":"{\"data\":{...},\"typeInfo\":{...}}"},
 *  "typeInfo":{"hp":"int","stats":"container"}}
 * ```
 *
 * Payload rules:
 * - bool: "true" / "false" (decoded case-insensitively)
 * - int, long: decimal text
 * - float, double: shortest round-trip text
 * - string: the raw string
 * - geometry, asset_ref: the type's own JSON field layout
 * - container: the nested document, embedded as a string
 * - container_list: {"type":"container_list","elementType":"container",
 *   "items":[document, ...]}
 * - container_map: {"type":"container_map","keys":[...],"values":[document, ...]}
 * - null: "" with type id "null"
 * - null container property: JSON null with type id "container"
 * - Blob and unknown ids: JSON text of the payload
 *
 * Decoding never throws: a payload that cannot be decoded as its declared
 * type logs a warning and yields that type's default; a malformed
 * document yields a partially populated (or empty) container.
 */

#ifndef STRATUM_CODEC_HPP
#define STRATUM_CODEC_HPP

#include "stratum/Value.hpp"

#include <nlohmann/json.hpp>
#include <cstddef>
#include <string>

namespace stratum {

/// Nesting depth beyond which encoding and decoding stop descending
inline constexpr std::size_t kMaxNestingDepth = 256;

/**
 * @brief Encode a value into its string payload
 *
 * The type id to store beside the payload is type_id(value).
 */
std::string serialize_value(const Value& value);

/**
 * @brief Decode a payload written for the given type id
 *
 * Unknown ids decode to a Blob carrying the id (payload parsed as JSON
 * when possible, kept as a JSON string otherwise).
 */
Value deserialize_value(const std::string& payload, const std::string& type_id);

/**
 * @brief Encode a container into the wire document (compact JSON text)
 *
 * A container reachable from itself is written as "null" at the point
 * where the cycle closes, with a warning.
 */
std::string encode_container(const Container& container);

/**
 * @brief Decode a wire document into a new container
 *
 * Empty text, "{}" and documents without "data" give an empty container.
 */
ContainerPtr decode_container(const std::string& text);

/**
 * @brief Readable JSON export of a container
 *
 * Containers become objects, lists arrays, maps objects, geometry and
 * asset references their field layout, Blobs their payload. Key order
 * follows display order. Not meant to be decoded back.
 */
nlohmann::ordered_json to_plain_json(const Container& container);

/// Readable JSON export of a single value (same rules as to_plain_json)
nlohmann::ordered_json value_to_plain_json(const Value& value);

} // namespace stratum

#endif // STRATUM_CODEC_HPP
