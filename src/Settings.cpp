/**
 * @file Settings.cpp
 * @brief Settings defaults, layered loading and environment mapping
 */

#include "stratum/Settings.hpp"
#include "stratum/Errors.hpp"
#include "stratum/Loader.hpp"
#include "stratum/Log.hpp"
#include "stratum/Util.hpp"

#include <iterator>

namespace stratum {

namespace {

const char* const kSettingsSource = "<settings>";

// Later layers win; objects present in both layers are merged key by key.
void merge_layer(nlohmann::json& base, const nlohmann::json& layer) {
    if (!base.is_object() || !layer.is_object()) {
        base = layer;
        return;
    }
    for (const auto& item : layer.items()) {
        auto found = base.find(item.key());
        if (found != base.end() && found->is_object() && item.value().is_object()) {
            merge_layer(*found, item.value());
        } else {
            base[item.key()] = item.value();
        }
    }
}

// Writes value at a dotted key, replacing any non-object on the way.
void set_by_dot(nlohmann::json& root, const std::string& path, const nlohmann::json& value) {
    const std::vector<std::string> segments = split(path, '.');
    if (segments.empty()) return;
    nlohmann::json* node = &root;
    for (auto seg = segments.begin(); seg != std::prev(segments.end()); ++seg) {
        nlohmann::json& next = (*node)[*seg];
        if (!next.is_object()) {
            next = nlohmann::json::object();
        }
        node = &next;
    }
    (*node)[segments.back()] = value;
}

const nlohmann::json* find_by_dot(const nlohmann::json& obj, const std::string& path) {
    const nlohmann::json* node = &obj;
    for (const auto& part : split(path, '.')) {
        if (!node->is_object()) return nullptr;
        auto it = node->find(part);
        if (it == node->end()) return nullptr;
        node = &*it;
    }
    return node;
}

[[noreturn]] void bad_value(const std::string& key, const std::string& details) {
    throw DocumentParseError(kSettingsSource, 0, 0, key + ": " + details);
}

void read_string(const nlohmann::json& doc, const std::string& key, std::string& out) {
    const auto* node = find_by_dot(doc, key);
    if (!node || node->is_null()) return;
    if (!node->is_string()) {
        bad_value(key, "expected a string, got " + std::string(node->type_name()));
    }
    out = node->get<std::string>();
}

} // anonymous namespace

nlohmann::json Settings::to_json() const {
    return nlohmann::json{
        {"log", {{"level", log_level}, {"pattern", log_pattern}}},
        {"diff", {{"collections", to_string(collection_diff)}}},
        {"instance", {{"write_mode", to_string(write_mode)}}},
        {"dump", {{"format", dump_format}, {"indent", dump_indent}}}
    };
}

Settings settings_from_json(const nlohmann::json& doc) {
    Settings settings;
    if (doc.is_null()) {
        return settings;
    }
    if (!doc.is_object()) {
        bad_value("<root>", "expected a table/object");
    }

    read_string(doc, "log.level", settings.log_level);
    read_string(doc, "log.pattern", settings.log_pattern);

    std::string collections = to_string(settings.collection_diff);
    read_string(doc, "diff.collections", collections);
    if (!parse_collection_diff(collections, settings.collection_diff)) {
        bad_value("diff.collections", "unknown mode '" + collections + "'");
    }

    std::string write_mode = to_string(settings.write_mode);
    read_string(doc, "instance.write_mode", write_mode);
    if (!parse_write_mode(write_mode, settings.write_mode)) {
        bad_value("instance.write_mode", "unknown mode '" + write_mode + "'");
    }

    read_string(doc, "dump.format", settings.dump_format);
    settings.dump_format = to_lower(settings.dump_format);
    if (settings.dump_format != "json" && settings.dump_format != "toml") {
        bad_value("dump.format", "expected 'json' or 'toml', got '" + settings.dump_format + "'");
    }

    if (const auto* indent = find_by_dot(doc, "dump.indent"); indent && !indent->is_null()) {
        if (!indent->is_number_integer() || indent->get<long long>() < 0 ||
            indent->get<long long>() > 16) {
            bad_value("dump.indent", "expected an integer between 0 and 16");
        }
        settings.dump_indent = indent->get<int>();
    }

    return settings;
}

std::string transform_env_name(const std::string& name) {
    // Lowercase, '__' -> '_', '_' -> '.'
    const std::string marker = "\x1F";
    std::string key = replace_all(to_lower(name), "__", marker);
    key = replace_all(key, "_", ".");
    return replace_all(key, marker, "_");
}

std::vector<std::pair<std::string, std::string>> collect_env_vars(const std::string& prefix) {
    std::vector<std::pair<std::string, std::string>> matches;
    const size_t stem_end = prefix.find_last_not_of('_');
    if (stem_end == std::string::npos) {
        return matches;
    }
    const std::string head = prefix.substr(0, stem_end + 1) + "_";

    for (auto& entry : enumerate_environment()) {
        if (entry.first.size() > head.size() && starts_with_icase(entry.first, head)) {
            matches.emplace_back(entry.first.substr(head.size()), std::move(entry.second));
        }
    }
    return matches;
}

Settings load_settings(const LoadOptions& options) {
    // 1) defaults
    nlohmann::json merged = Settings{}.to_json();

    // 2) file
    if (options.file_path.has_value() && !options.file_path->empty()) {
        nlohmann::json file_doc = load_document_file(*options.file_path);
        if (!file_doc.is_object()) {
            throw DocumentParseError(*options.file_path, 0, 0, "settings root must be a table/object");
        }
        merge_layer(merged, file_doc);
    }

    // 3) env
    for (const auto& [name, value] : collect_env_vars(options.prefix)) {
        const std::string key = transform_env_name(name);
        if (key.empty()) continue;
        set_by_dot(merged, key, parse_json_or_string(value));
    }

    // 4) overrides
    for (const auto& [key, value] : options.overrides) {
        set_by_dot(merged, key, value);
    }

    return settings_from_json(merged);
}

void apply_settings(const Settings& settings) {
    if (!set_log_level(settings.log_level)) {
        logger()->warn("Settings: unknown log level '{}'; level unchanged", settings.log_level);
    }
    if (!settings.log_pattern.empty()) {
        logger()->set_pattern(settings.log_pattern);
    }
}

} // namespace stratum
