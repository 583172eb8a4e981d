/**
 * @file Value.hpp
 * @brief Closed tagged union of everything a Container can store
 *
 * Value kinds:
 * - Null (std::monostate)
 * - Bool, Int (int32), Long (int64), Float, Double, String
 * - Geometric types (Vector2/3/4, Quaternion, Color, Rect, Bounds)
 * - AssetReference (opaque external asset handle)
 * - Container (shared, nestable)
 * - ContainerList (ordered sequence of Containers)
 * - ContainerMap (ordered string -> Container map)
 * - Blob (opaque payload with a host type id; scalar collections and
 *   host types the core does not know)
 *
 * Every kind has a stable type identifier used by the wire format and by
 * override entries. Only Container-valued collections are navigable by
 * path; a Blob is carried through untouched.
 */

#ifndef STRATUM_VALUE_HPP
#define STRATUM_VALUE_HPP

#include "stratum/AssetReference.hpp"
#include "stratum/Geometry.hpp"
#include "stratum/OrderedMap.hpp"

#include <nlohmann/json.hpp>
#include <cstdint>
#include <memory>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace stratum {

class Container;

using ContainerPtr = std::shared_ptr<Container>;
using ContainerList = std::vector<ContainerPtr>;
using ContainerMap = OrderedMap<std::string, ContainerPtr>;

/**
 * @brief Opaque value the core stores and round-trips without interpreting
 */
struct Blob {
    std::string type_id;
    nlohmann::json payload;
};

bool operator==(const Blob& a, const Blob& b);
bool operator!=(const Blob& a, const Blob& b);

using Value = std::variant<
    std::monostate,
    bool,
    std::int32_t,
    std::int64_t,
    float,
    double,
    std::string,
    Vector2,
    Vector3,
    Vector4,
    Quaternion,
    Color,
    Rect,
    Bounds,
    AssetReference,
    ContainerPtr,
    ContainerList,
    ContainerMap,
    Blob
>;

// ============================================================================
// Type identifiers
// ============================================================================

template <typename T>
struct ValueTraits;

template <> struct ValueTraits<std::monostate> { static constexpr const char* type_id = "null"; };
template <> struct ValueTraits<bool> { static constexpr const char* type_id = "bool"; };
template <> struct ValueTraits<std::int32_t> { static constexpr const char* type_id = "int"; };
template <> struct ValueTraits<std::int64_t> { static constexpr const char* type_id = "long"; };
template <> struct ValueTraits<float> { static constexpr const char* type_id = "float"; };
template <> struct ValueTraits<double> { static constexpr const char* type_id = "double"; };
template <> struct ValueTraits<std::string> { static constexpr const char* type_id = "string"; };
template <> struct ValueTraits<Vector2> { static constexpr const char* type_id = "vector2"; };
template <> struct ValueTraits<Vector3> { static constexpr const char* type_id = "vector3"; };
template <> struct ValueTraits<Vector4> { static constexpr const char* type_id = "vector4"; };
template <> struct ValueTraits<Quaternion> { static constexpr const char* type_id = "quaternion"; };
template <> struct ValueTraits<Color> { static constexpr const char* type_id = "color"; };
template <> struct ValueTraits<Rect> { static constexpr const char* type_id = "rect"; };
template <> struct ValueTraits<Bounds> { static constexpr const char* type_id = "bounds"; };
template <> struct ValueTraits<AssetReference> { static constexpr const char* type_id = "asset_ref"; };
template <> struct ValueTraits<ContainerPtr> { static constexpr const char* type_id = "container"; };
template <> struct ValueTraits<ContainerList> { static constexpr const char* type_id = "container_list"; };
template <> struct ValueTraits<ContainerMap> { static constexpr const char* type_id = "container_map"; };
// Nominal id; a stored Blob reports its own type_id
template <> struct ValueTraits<Blob> { static constexpr const char* type_id = "blob"; };

namespace detail {

template <typename T, typename Variant>
struct is_variant_member;

template <typename T, typename... Ts>
struct is_variant_member<T, std::variant<Ts...>>
    : std::disjunction<std::is_same<T, Ts>...> {};

} // namespace detail

/// True for the C++ types a Value can hold
template <typename T>
inline constexpr bool is_value_type_v = detail::is_variant_member<T, Value>::value;

/**
 * @brief Stable type identifier of a stored value
 *
 * A Blob reports the host type id it carries.
 */
std::string type_id(const Value& value);

/**
 * @brief Check whether a type id names one of the built-in kinds
 * @param id Type identifier (e.g., "int", "container_map")
 */
bool is_known_type_id(const std::string& id);

/**
 * @brief Default value for a type id
 *
 * Built-in ids yield a default-constructed value of that kind (a fresh
 * empty Container for "container"); unknown ids yield an empty Blob
 * carrying the id.
 */
Value default_value(const std::string& id);

/// Human-readable rendering used in diagnostics and CLI output
std::string describe_value(const Value& value);

/**
 * @brief Deep structural equality
 *
 * Containers are compared by content (not identity); a null ContainerPtr
 * only equals another null. Cycles are tolerated.
 */
bool values_equal(const Value& a, const Value& b);

/**
 * @brief Deep copy
 *
 * Containers, list elements and map values are copied recursively; leaf
 * kinds are copied by value.
 */
Value copy_value(const Value& value);

} // namespace stratum

#endif // STRATUM_VALUE_HPP
