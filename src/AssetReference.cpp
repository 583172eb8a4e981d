#include "stratum/AssetReference.hpp"
#include "stratum/Errors.hpp"
#include "stratum/Util.hpp"

namespace stratum {

std::string to_string(AssetStorage storage) {
    switch (storage) {
        case AssetStorage::Registry: return "Registry";
        case AssetStorage::Resources: return "Resources";
        case AssetStorage::Addressable: return "Addressable";
    }
    return "Registry";
}

std::optional<AssetStorage> parse_asset_storage(const std::string& name) {
    const std::string lowered = to_lower(trim(name));
    if (lowered == "registry") return AssetStorage::Registry;
    if (lowered == "resources") return AssetStorage::Resources;
    if (lowered == "addressable") return AssetStorage::Addressable;
    return std::nullopt;
}

bool operator==(const AssetReference& a, const AssetReference& b) {
    return a.storage == b.storage && a.key == b.key && a.type_name == b.type_name;
}

bool operator!=(const AssetReference& a, const AssetReference& b) {
    return !(a == b);
}

void to_json(nlohmann::json& j, const AssetReference& ref) {
    j = nlohmann::json{
        {"storageType", to_string(ref.storage)},
        {"key", ref.key},
        {"typeName", ref.type_name}
    };
}

void from_json(const nlohmann::json& j, AssetReference& ref) {
    const auto storage_name = j.at("storageType").get<std::string>();
    auto storage = parse_asset_storage(storage_name);
    if (!storage) {
        throw InvalidArgumentError("storageType", "unknown asset storage '" + storage_name + "'");
    }
    ref.storage = *storage;
    j.at("key").get_to(ref.key);
    ref.type_name = j.value("typeName", std::string());
}

} // namespace stratum
