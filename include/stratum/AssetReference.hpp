/**
 * @file AssetReference.hpp
 * @brief Opaque handle to an externally managed asset
 *
 * The core stores, copies, compares and round-trips asset references but
 * never resolves them; loading the referenced asset is the host's job.
 */

#ifndef STRATUM_ASSETREFERENCE_HPP
#define STRATUM_ASSETREFERENCE_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace stratum {

/**
 * @brief Where the host looks the referenced asset up
 */
enum class AssetStorage {
    Registry,     ///< Host-side registry keyed by name
    Resources,    ///< Path inside the host's bundled resources
    Addressable   ///< Address in the host's addressable asset system
};

std::string to_string(AssetStorage storage);

/**
 * @brief Parse a storage kind name (case-insensitive)
 * @return std::nullopt for unknown names
 */
std::optional<AssetStorage> parse_asset_storage(const std::string& name);

struct AssetReference {
    AssetStorage storage = AssetStorage::Registry;
    std::string key;
    std::string type_name;

    /// True when the reference points at nothing
    bool empty() const noexcept { return key.empty(); }
};

bool operator==(const AssetReference& a, const AssetReference& b);
bool operator!=(const AssetReference& a, const AssetReference& b);

/// {"storageType": "Registry", "key": "...", "typeName": "..."}
void to_json(nlohmann::json& j, const AssetReference& ref);

/**
 * @throws nlohmann::json::exception on missing or mistyped fields
 * @throws InvalidArgumentError on an unknown storage kind
 */
void from_json(const nlohmann::json& j, AssetReference& ref);

} // namespace stratum

#endif // STRATUM_ASSETREFERENCE_HPP
