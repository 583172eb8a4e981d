/**
 * @file Codec.cpp
 * @brief Value payload encoding and the container wire document
 */

#include "stratum/Codec.hpp"
#include "stratum/Container.hpp"
#include "stratum/Log.hpp"
#include "stratum/Util.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cstdlib>
#include <limits>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <unordered_set>

namespace stratum {

using ordered_json = nlohmann::ordered_json;

namespace {

// ============================================================================
// Encoding
// ============================================================================

struct EncodeState {
    std::unordered_set<const Container*> active;
    std::size_t depth = 0;
};

// Marks a container as being encoded for the lifetime of the guard
class ActiveGuard {
public:
    ActiveGuard(EncodeState& state, const Container* container)
        : state_(state), container_(container) {
        state_.active.insert(container_);
        ++state_.depth;
    }

    ~ActiveGuard() {
        --state_.depth;
        state_.active.erase(container_);
    }

    ActiveGuard(const ActiveGuard&) = delete;
    ActiveGuard& operator=(const ActiveGuard&) = delete;

private:
    EncodeState& state_;
    const Container* container_;
};

std::string encode_document(const Container& container, EncodeState& state);

// nullopt when the container closes a cycle or is nested too deep
std::optional<std::string> encode_nested(const Container& container, EncodeState& state) {
    if (state.active.count(&container) > 0) {
        logger()->warn("Codec: container graph contains a cycle; back-reference written as null");
        return std::nullopt;
    }
    if (state.depth >= kMaxNestingDepth) {
        logger()->warn("Codec: nesting deeper than {} levels; written as null", kMaxNestingDepth);
        return std::nullopt;
    }
    return encode_document(container, state);
}

template <typename T>
std::string dump_fields(const T& value) {
    nlohmann::json j = value;
    return j.dump();
}

// nullopt means "store as null"
std::optional<std::string> encode_payload(const Value& value, EncodeState& state) {
    return std::visit([&state](const auto& stored) -> std::optional<std::string> {
        using T = std::decay_t<decltype(stored)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return std::string();
        } else if constexpr (std::is_same_v<T, bool>) {
            return std::string(stored ? "true" : "false");
        } else if constexpr (std::is_same_v<T, std::int32_t> || std::is_same_v<T, std::int64_t>) {
            return std::to_string(stored);
        } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
            return fmt::format("{}", stored);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return stored;
        } else if constexpr (std::is_same_v<T, ContainerPtr>) {
            if (!stored) return std::nullopt;
            return encode_nested(*stored, state);
        } else if constexpr (std::is_same_v<T, ContainerList>) {
            ordered_json payload = {
                {"type", ValueTraits<ContainerList>::type_id},
                {"elementType", ValueTraits<ContainerPtr>::type_id},
                {"items", ordered_json::array()}
            };
            for (const auto& item : stored) {
                std::optional<std::string> encoded;
                if (item) encoded = encode_nested(*item, state);
                if (encoded) {
                    payload["items"].push_back(*encoded);
                } else {
                    payload["items"].push_back(nullptr);
                }
            }
            return payload.dump();
        } else if constexpr (std::is_same_v<T, ContainerMap>) {
            ordered_json payload = {
                {"type", ValueTraits<ContainerMap>::type_id},
                {"keys", ordered_json::array()},
                {"values", ordered_json::array()}
            };
            for (const auto& [key, item] : stored) {
                std::optional<std::string> encoded;
                if (item) encoded = encode_nested(*item, state);
                payload["keys"].push_back(key);
                if (encoded) {
                    payload["values"].push_back(*encoded);
                } else {
                    payload["values"].push_back(nullptr);
                }
            }
            return payload.dump();
        } else if constexpr (std::is_same_v<T, Blob>) {
            return stored.payload.dump();
        } else {
            // Geometry and asset references
            return dump_fields(stored);
        }
    }, value);
}

std::string encode_document(const Container& container, EncodeState& state) {
    ActiveGuard guard(state, &container);

    ordered_json data = ordered_json::object();
    ordered_json types = ordered_json::object();
    for (const auto& [key, value] : container.entries()) {
        if (const auto* child = std::get_if<ContainerPtr>(&value); child && !*child) {
            data[key] = nullptr;
            types[key] = ValueTraits<ContainerPtr>::type_id;
            continue;
        }
        auto payload = encode_payload(value, state);
        if (payload) {
            data[key] = *payload;
            types[key] = type_id(value);
        } else {
            data[key] = "";
            types[key] = ValueTraits<std::monostate>::type_id;
        }
    }

    ordered_json doc = ordered_json::object();
    doc["data"] = std::move(data);
    doc["typeInfo"] = std::move(types);
    return doc.dump();
}

// ============================================================================
// Decoding
// ============================================================================

ContainerPtr decode_document(const std::string& text, std::size_t depth);

template <typename Int>
Int parse_integer(const std::string& payload) {
    const std::string text = trim(payload);
    std::size_t consumed = 0;
    const long long parsed = std::stoll(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("trailing characters after integer");
    }
    if (parsed < static_cast<long long>(std::numeric_limits<Int>::min()) ||
        parsed > static_cast<long long>(std::numeric_limits<Int>::max())) {
        throw std::out_of_range("integer out of range");
    }
    return static_cast<Int>(parsed);
}

template <typename Float>
Float parse_floating(const std::string& payload) {
    const std::string text = trim(payload);
    if (text.empty()) {
        throw std::invalid_argument("empty number");
    }
    char* end = nullptr;
    Float parsed;
    if constexpr (std::is_same_v<Float, float>) {
        parsed = std::strtof(text.c_str(), &end);
    } else {
        parsed = std::strtod(text.c_str(), &end);
    }
    if (end != text.c_str() + text.size()) {
        throw std::invalid_argument("not a number");
    }
    return parsed;
}

bool parse_bool(const std::string& payload) {
    const std::string text = to_lower(trim(payload));
    if (text == "true") return true;
    if (text == "false") return false;
    throw std::invalid_argument("not a boolean");
}

template <typename T>
T parse_fields(const std::string& payload) {
    return nlohmann::json::parse(payload).get<T>();
}

ContainerPtr decode_element(const ordered_json& item, std::size_t depth) {
    if (item.is_null()) {
        return nullptr;
    }
    if (!item.is_string()) {
        logger()->warn("Codec: collection element is not an embedded document; using an empty container");
        return std::make_shared<Container>();
    }
    return decode_document(item.get<std::string>(), depth + 1);
}

ContainerList decode_list(const std::string& payload, std::size_t depth) {
    const auto doc = ordered_json::parse(payload);
    ContainerList list;
    const auto& items = doc.at("items");
    if (!items.is_array()) {
        throw std::invalid_argument("'items' is not an array");
    }
    list.reserve(items.size());
    for (const auto& item : items) {
        list.push_back(decode_element(item, depth));
    }
    return list;
}

ContainerMap decode_map(const std::string& payload, std::size_t depth) {
    const auto doc = ordered_json::parse(payload);
    const auto& keys = doc.at("keys");
    const auto& values = doc.at("values");
    if (!keys.is_array() || !values.is_array()) {
        throw std::invalid_argument("'keys' and 'values' must be arrays");
    }
    if (keys.size() != values.size()) {
        logger()->warn("Codec: container_map has {} keys but {} values; extra entries dropped",
                       keys.size(), values.size());
    }
    ContainerMap map;
    const std::size_t count = std::min(keys.size(), values.size());
    for (std::size_t i = 0; i < count; ++i) {
        map.set(keys[i].get<std::string>(), decode_element(values[i], depth));
    }
    return map;
}

Blob decode_blob(const std::string& payload, const std::string& id) {
    auto parsed = nlohmann::json::parse(payload, nullptr, false);
    if (parsed.is_discarded()) {
        return Blob{id, nlohmann::json(payload)};
    }
    return Blob{id, std::move(parsed)};
}

Value decode_payload(const std::string& payload, const std::string& id, std::size_t depth) {
    try {
        if (id == "null") return std::monostate{};
        if (id == "bool") return parse_bool(payload);
        if (id == "int") return parse_integer<std::int32_t>(payload);
        if (id == "long") return parse_integer<std::int64_t>(payload);
        if (id == "float") return parse_floating<float>(payload);
        if (id == "double") return parse_floating<double>(payload);
        if (id == "string") return payload;
        if (id == "vector2") return parse_fields<Vector2>(payload);
        if (id == "vector3") return parse_fields<Vector3>(payload);
        if (id == "vector4") return parse_fields<Vector4>(payload);
        if (id == "quaternion") return parse_fields<Quaternion>(payload);
        if (id == "color") return parse_fields<Color>(payload);
        if (id == "rect") return parse_fields<Rect>(payload);
        if (id == "bounds") return parse_fields<Bounds>(payload);
        if (id == "asset_ref") return parse_fields<AssetReference>(payload);
        if (id == "container") return decode_document(payload, depth + 1);
        if (id == "container_list") return decode_list(payload, depth);
        if (id == "container_map") return decode_map(payload, depth);
    } catch (const std::exception& e) {
        logger()->warn("Codec: cannot decode '{}' as {}: {}; using default", payload, id, e.what());
        return default_value(id);
    }

    logger()->debug("Codec: unknown type id '{}' kept as opaque payload", id);
    return decode_blob(payload, id);
}

ContainerPtr decode_document(const std::string& text, std::size_t depth) {
    auto container = std::make_shared<Container>();
    if (depth > kMaxNestingDepth) {
        logger()->warn("Codec: document nested deeper than {} levels; left empty", kMaxNestingDepth);
        return container;
    }
    if (trim(text).empty()) {
        return container;
    }

    const auto doc = ordered_json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        logger()->warn("Codec: malformed container document; using an empty container");
        return container;
    }

    auto data_it = doc.find("data");
    if (data_it == doc.end()) {
        return container;
    }
    if (!data_it->is_object()) {
        logger()->warn("Codec: 'data' is not an object; using an empty container");
        return container;
    }

    const ordered_json empty_types = ordered_json::object();
    const ordered_json* types = &empty_types;
    auto types_it = doc.find("typeInfo");
    if (types_it != doc.end() && types_it->is_object()) {
        types = &*types_it;
    }

    for (auto it = data_it->begin(); it != data_it->end(); ++it) {
        const std::string& key = it.key();
        if (key.empty()) {
            logger()->warn("Codec: entry with an empty key skipped");
            continue;
        }
        auto type_it = types->find(key);
        if (type_it == types->end() || !type_it->is_string()) {
            logger()->warn("Codec: no type info for key '{}'; entry skipped", key);
            continue;
        }

        const std::string type = type_it->get<std::string>();
        if (it.value().is_null() && type == ValueTraits<ContainerPtr>::type_id) {
            container->set(key, ContainerPtr());
            continue;
        }

        std::string payload;
        if (it.value().is_string()) {
            payload = it.value().get<std::string>();
        } else if (!it.value().is_null()) {
            payload = it.value().dump();
        }
        container->set(key, decode_payload(payload, type, depth));
    }
    return container;
}

// ============================================================================
// Plain JSON export
// ============================================================================

ordered_json plain_container(const Container& container, EncodeState& state);

template <typename T>
ordered_json plain_fields(const T& value) {
    nlohmann::json j = value;
    return ordered_json::parse(j.dump());
}

ordered_json plain_nested(const ContainerPtr& container, EncodeState& state) {
    if (!container) return nullptr;
    if (state.active.count(container.get()) > 0 || state.depth >= kMaxNestingDepth) {
        logger()->warn("Codec: cyclic or too deep container exported as null");
        return nullptr;
    }
    return plain_container(*container, state);
}

ordered_json plain_value(const Value& value, EncodeState& state) {
    return std::visit([&state](const auto& stored) -> ordered_json {
        using T = std::decay_t<decltype(stored)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return nullptr;
        } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::int32_t> ||
                             std::is_same_v<T, std::int64_t> || std::is_same_v<T, float> ||
                             std::is_same_v<T, double> || std::is_same_v<T, std::string>) {
            return stored;
        } else if constexpr (std::is_same_v<T, ContainerPtr>) {
            return plain_nested(stored, state);
        } else if constexpr (std::is_same_v<T, ContainerList>) {
            ordered_json out = ordered_json::array();
            for (const auto& item : stored) {
                out.push_back(plain_nested(item, state));
            }
            return out;
        } else if constexpr (std::is_same_v<T, ContainerMap>) {
            ordered_json out = ordered_json::object();
            for (const auto& [key, item] : stored) {
                out[key] = plain_nested(item, state);
            }
            return out;
        } else if constexpr (std::is_same_v<T, Blob>) {
            return ordered_json::parse(stored.payload.dump());
        } else {
            return plain_fields(stored);
        }
    }, value);
}

ordered_json plain_container(const Container& container, EncodeState& state) {
    ActiveGuard guard(state, &container);
    ordered_json out = ordered_json::object();
    for (const auto& [key, value] : container.entries()) {
        out[key] = plain_value(value, state);
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

std::string serialize_value(const Value& value) {
    EncodeState state;
    return encode_payload(value, state).value_or(std::string());
}

Value deserialize_value(const std::string& payload, const std::string& type_id) {
    return decode_payload(payload, type_id, 0);
}

std::string encode_container(const Container& container) {
    EncodeState state;
    return encode_document(container, state);
}

ContainerPtr decode_container(const std::string& text) {
    return decode_document(text, 0);
}

nlohmann::ordered_json to_plain_json(const Container& container) {
    EncodeState state;
    return plain_container(container, state);
}

nlohmann::ordered_json value_to_plain_json(const Value& value) {
    EncodeState state;
    return plain_value(value, state);
}

} // namespace stratum
