/**
 * @file Value.cpp
 * @brief Type identifiers and defaults for the Value union
 *
 * Deep equality and deep copy live in Container.cpp next to the
 * container traversal they share.
 */

#include "stratum/Value.hpp"
#include "stratum/Codec.hpp"
#include "stratum/Container.hpp"

#include <type_traits>

namespace stratum {

bool operator==(const Blob& a, const Blob& b) {
    return a.type_id == b.type_id && a.payload == b.payload;
}

bool operator!=(const Blob& a, const Blob& b) {
    return !(a == b);
}

std::string type_id(const Value& value) {
    return std::visit([](const auto& stored) -> std::string {
        using T = std::decay_t<decltype(stored)>;
        if constexpr (std::is_same_v<T, Blob>) {
            return stored.type_id;
        } else {
            return ValueTraits<T>::type_id;
        }
    }, value);
}

bool is_known_type_id(const std::string& id) {
    static const char* const known[] = {
        "null", "bool", "int", "long", "float", "double", "string",
        "vector2", "vector3", "vector4", "quaternion", "color", "rect", "bounds",
        "asset_ref", "container", "container_list", "container_map"
    };
    for (const char* candidate : known) {
        if (id == candidate) return true;
    }
    return false;
}

Value default_value(const std::string& id) {
    if (id == "null") return std::monostate{};
    if (id == "bool") return false;
    if (id == "int") return std::int32_t{0};
    if (id == "long") return std::int64_t{0};
    if (id == "float") return 0.0f;
    if (id == "double") return 0.0;
    if (id == "string") return std::string();
    if (id == "vector2") return Vector2{};
    if (id == "vector3") return Vector3{};
    if (id == "vector4") return Vector4{};
    if (id == "quaternion") return Quaternion{};
    if (id == "color") return Color{};
    if (id == "rect") return Rect{};
    if (id == "bounds") return Bounds{};
    if (id == "asset_ref") return AssetReference{};
    if (id == "container") return std::make_shared<Container>();
    if (id == "container_list") return ContainerList{};
    if (id == "container_map") return ContainerMap{};
    return Blob{id, nullptr};
}

std::string describe_value(const Value& value) {
    return std::visit([&value](const auto& stored) -> std::string {
        using T = std::decay_t<decltype(stored)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, ContainerPtr>) {
            if (!stored) return "container(null)";
            return "container(" + std::to_string(stored->size()) + " keys)";
        } else if constexpr (std::is_same_v<T, ContainerList>) {
            return "container_list(" + std::to_string(stored.size()) + " items)";
        } else if constexpr (std::is_same_v<T, ContainerMap>) {
            return "container_map(" + std::to_string(stored.size()) + " entries)";
        } else {
            return serialize_value(value);
        }
    }, value);
}

} // namespace stratum
