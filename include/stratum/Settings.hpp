/**
 * @file Settings.hpp
 * @brief Library and tool settings with layered loading
 *
 * Precedence (lowest to highest):
 *   defaults -> settings file (.json/.toml) -> environment -> overrides
 *
 * Keys (dot paths in the merged document):
 * - log.level            "trace" | "debug" | "info" | "warn" | "error" | "critical" | "off"
 * - log.pattern          spdlog pattern, empty keeps the logger's own
 * - diff.collections     "structural" | "identity"
 * - instance.write_mode  "persistent" | "ephemeral"
 * - dump.format          "json" | "toml"
 * - dump.indent          integer >= 0
 *
 * Environment variables are matched by prefix (case-insensitive) and
 * mapped to keys by lowercasing and turning '_' into '.', with '__'
 * kept as a literal underscore:
 *   STRATUM_LOG_LEVEL=debug            -> log.level
 *   STRATUM_INSTANCE_WRITE__MODE=...   -> instance.write_mode
 * Values are parsed as JSON when possible, otherwise taken as strings.
 *
 * Unknown keys are ignored.
 */

#ifndef STRATUM_SETTINGS_HPP
#define STRATUM_SETTINGS_HPP

#include "stratum/Diff.hpp"
#include "stratum/Instance.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stratum {

struct Settings {
    std::string log_level = "warn";
    std::string log_pattern;
    CollectionDiff collection_diff = CollectionDiff::Structural;
    WriteMode write_mode = WriteMode::Persistent;
    std::string dump_format = "json";
    int dump_indent = 2;

    DiffOptions diff_options() const { return DiffOptions{collection_diff}; }

    /// Nested document using the keys listed above
    nlohmann::json to_json() const;
};

/**
 * @brief Options for building Settings from multiple sources.
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    std::string prefix = "STRATUM";                   // Empty disables environment lookup
    std::map<std::string, nlohmann::json> overrides;  // final precedence, dot keys
};

/**
 * @brief Load settings using the documented precedence
 * @throws FileNotFoundError if file_path names a missing file
 * @throws DocumentParseError on malformed files or wrongly typed values
 */
Settings load_settings(const LoadOptions& options);

/**
 * @brief Build settings from a merged document
 * @throws DocumentParseError if a known key has the wrong type or an
 *         unknown enumerator
 */
Settings settings_from_json(const nlohmann::json& doc);

/// Push logging settings into the active logger
void apply_settings(const Settings& settings);

/**
 * @brief Map an environment variable name (prefix removed) to a dot key
 *
 * DATABASE_HOST -> database.host, WRITE__MODE -> write_mode
 */
std::string transform_env_name(const std::string& name);

/**
 * @brief Environment variables whose name starts with PREFIX_
 * @return (name without prefix, value) pairs; empty if prefix is empty
 */
std::vector<std::pair<std::string, std::string>> collect_env_vars(const std::string& prefix);

} // namespace stratum

#endif // STRATUM_SETTINGS_HPP
