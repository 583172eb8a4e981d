/**
 * @file Instance.cpp
 * @brief Override bookkeeping and runtime materialization
 */

#include "stratum/Instance.hpp"
#include "stratum/Codec.hpp"
#include "stratum/Log.hpp"
#include "stratum/Template.hpp"
#include "stratum/Util.hpp"

#include <nlohmann/json.hpp>
#include <algorithm>

namespace stratum {

namespace {

// True if candidate addresses something strictly inside path
bool is_below(const std::string& candidate, const std::string& path) {
    if (candidate.size() <= path.size() || candidate.compare(0, path.size(), path) != 0) {
        return false;
    }
    const char next = candidate[path.size()];
    return next == '.' || next == '[';
}

} // anonymous namespace

std::string to_string(WriteMode mode) {
    return mode == WriteMode::Ephemeral ? "ephemeral" : "persistent";
}

bool parse_write_mode(const std::string& name, WriteMode& out) {
    const std::string lowered = to_lower(trim(name));
    if (lowered == "persistent") {
        out = WriteMode::Persistent;
        return true;
    }
    if (lowered == "ephemeral") {
        out = WriteMode::Ephemeral;
        return true;
    }
    return false;
}

Instance::Instance(const Template& parent, std::string id, WriteMode mode)
    : parent_(&parent)
    , id_(std::move(id))
    , mode_(mode) {
    if (id_.empty()) {
        id_ = generate_id();
    }
}

Instance Instance::from_working_copy(const Template& parent, const Container& working_copy,
                                     std::string id, WriteMode mode,
                                     const DiffOptions& options) {
    Instance instance(parent, std::move(id), mode);
    instance.load_overrides(diff_containers(parent.container(), working_copy, options));
    logger()->debug("Instance '{}': seeded {} override(s) from working copy",
                    instance.id_, instance.overrides_.size());
    return instance;
}

// ============================================================================
// Materialization
// ============================================================================

const Container& Instance::container() {
    return materialize();
}

Container& Instance::materialize() {
    if (!runtime_ || built_revision_ != parent_->revision()) {
        rebuild();
    }
    return *runtime_;
}

void Instance::rebuild() {
    ContainerPtr runtime = parent_->container().deep_copy();
    std::size_t skipped = 0;
    for (const auto& entry : overrides_) {
        try {
            runtime->path_set(entry.path, deserialize_value(entry.value, entry.type));
        } catch (const StratumError& e) {
            ++skipped;
            logger()->warn("Instance '{}': override '{}' ({}) skipped: {}",
                           id_, entry.path, entry.type, e.what());
        }
    }
    runtime_ = std::move(runtime);
    built_revision_ = parent_->revision();
    original_values_.clear();
    logger()->debug("Instance '{}': materialized with {} override(s), {} skipped",
                    id_, overrides_.size() - skipped, skipped);
}

void Instance::invalidate() {
    runtime_.reset();
    original_values_.clear();
}

// ============================================================================
// Writes
// ============================================================================

void Instance::set_value(const std::string& path, Value value) {
    set_value(path, std::move(value), mode_);
}

void Instance::set_value(const std::string& path, Value value, WriteMode mode) {
    Container& runtime = materialize();

    if (mode == WriteMode::Ephemeral) {
        const bool first_write = !original_values_.contains_key(path);
        std::optional<Value> before;
        if (first_write) {
            if (auto current = runtime.path_find(path)) {
                before = copy_value(*current);
            }
        }
        runtime.path_set(path, std::move(value));
        if (first_write) {
            original_values_.set(path, std::move(before));
        }
        return;
    }

    // Validates the path before anything is recorded
    runtime.path_set(path, copy_value(value));

    // A write to path supersedes overrides recorded inside it
    overrides_.erase(std::remove_if(overrides_.begin(), overrides_.end(),
                                    [&path](const OverrideEntry& entry) {
                                        return is_below(entry.path, path);
                                    }),
                     overrides_.end());

    // Equal to the template and not under another override: nothing to record
    const bool shadowed = std::any_of(overrides_.begin(), overrides_.end(),
                                      [&path](const OverrideEntry& entry) {
                                          return is_below(path, entry.path);
                                      });
    auto template_value = parent_->container().path_find(path);
    if (!shadowed && template_value && values_equal(*template_value, value)) {
        erase_override(path);
    } else {
        upsert_override(make_override(path, value));
    }
    invalidate();
}

bool Instance::remove_override(const std::string& path) {
    if (!erase_override(path)) {
        return false;
    }
    original_values_.remove(path);

    if (!runtime_ || built_revision_ != parent_->revision()) {
        return true;
    }

    // An override above path still decides its value; rebuild instead of patching
    const bool shadowed = std::any_of(overrides_.begin(), overrides_.end(),
                                      [&path](const OverrideEntry& entry) {
                                          return is_below(path, entry.path);
                                      });
    if (shadowed) {
        invalidate();
        return true;
    }

    // Without a template value the override may have padded lists on its
    // way down; only a rebuild drops that padding
    auto template_value = parent_->container().path_find(path);
    if (!template_value) {
        invalidate();
        return true;
    }

    try {
        runtime_->path_set(path, copy_value(*template_value));
        replay_below(path);
    } catch (const StratumError& e) {
        logger()->warn("Instance '{}': cannot restore '{}' from template ({}); rebuilding",
                       id_, path, e.what());
        invalidate();
    }
    return true;
}

void Instance::replay_below(const std::string& path) {
    for (const auto& entry : overrides_) {
        if (!is_below(entry.path, path)) {
            continue;
        }
        try {
            runtime_->path_set(entry.path, deserialize_value(entry.value, entry.type));
        } catch (const StratumError& e) {
            logger()->warn("Instance '{}': override '{}' ({}) skipped: {}",
                           id_, entry.path, entry.type, e.what());
        }
    }
}

void Instance::reset() {
    overrides_.clear();
    invalidate();
}

// ============================================================================
// Overrides
// ============================================================================

void Instance::upsert_override(OverrideEntry entry) {
    erase_override(entry.path);
    overrides_.push_back(std::move(entry));
}

bool Instance::erase_override(const std::string& path) {
    const auto before = overrides_.size();
    overrides_.erase(std::remove_if(overrides_.begin(), overrides_.end(),
                                    [&path](const OverrideEntry& entry) {
                                        return entry.path == path;
                                    }),
                     overrides_.end());
    return overrides_.size() != before;
}

void Instance::load_overrides(std::vector<OverrideEntry> entries) {
    overrides_.clear();
    for (auto& entry : entries) {
        upsert_override(std::move(entry));
    }
    invalidate();
}

OrderedMap<std::string, Value> Instance::decoded_overrides() const {
    OrderedMap<std::string, Value> out;
    for (const auto& entry : overrides_) {
        out.set(entry.path, deserialize_value(entry.value, entry.type));
    }
    return out;
}

bool Instance::has_override(const std::string& path) const {
    return std::any_of(overrides_.begin(), overrides_.end(),
                       [&path](const OverrideEntry& entry) { return entry.path == path; });
}

bool Instance::is_runtime_modified(const std::string& path) const {
    return original_values_.contains_key(path);
}

// ============================================================================
// Persistence
// ============================================================================

std::string Instance::to_json() const {
    nlohmann::ordered_json entries = nlohmann::ordered_json::array();
    for (const auto& entry : overrides_) {
        entries.push_back(nlohmann::ordered_json{
            {"path", entry.path},
            {"type", entry.type},
            {"value", entry.value}
        });
    }
    nlohmann::ordered_json doc = {
        {"instanceId", id_},
        {"parentStructureId", parent_->id()},
        {"overrides", std::move(entries)}
    };
    return doc.dump(2);
}

void Instance::from_json(const std::string& text) {
    if (trim(text).empty()) {
        return;
    }
    const auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        logger()->error("Instance::from_json: malformed instance document; instance unchanged");
        return;
    }

    auto parent_it = doc.find("parentStructureId");
    if (parent_it != doc.end() && parent_it->is_string() &&
        parent_it->get<std::string>() != parent_->id()) {
        logger()->warn("Instance::from_json: document belongs to template '{}', not '{}'",
                       parent_it->get<std::string>(), parent_->id());
    }

    std::vector<OverrideEntry> entries;
    auto overrides_it = doc.find("overrides");
    if (overrides_it != doc.end() && !overrides_it->is_null()) {
        if (!overrides_it->is_array()) {
            logger()->error("Instance::from_json: 'overrides' is not an array; instance unchanged");
            return;
        }
        for (const auto& item : *overrides_it) {
            if (!item.is_object() || !item.contains("path") || !item["path"].is_string() ||
                !item.contains("type") || !item["type"].is_string() ||
                !item.contains("value") || !item["value"].is_string()) {
                logger()->warn("Instance::from_json: malformed override entry skipped: {}", item.dump());
                continue;
            }
            entries.push_back(OverrideEntry{
                item["path"].get<std::string>(),
                item["type"].get<std::string>(),
                item["value"].get<std::string>()
            });
        }
    }

    auto id_it = doc.find("instanceId");
    if (id_it != doc.end() && id_it->is_string() && !id_it->get<std::string>().empty()) {
        id_ = id_it->get<std::string>();
    }
    load_overrides(std::move(entries));
}

} // namespace stratum
