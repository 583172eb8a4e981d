/**
 * @file Instance.hpp
 * @brief Override-only view of a Template, materialized on demand
 *
 * An Instance persists nothing but its override list (and the id of its
 * template). Reads go through a runtime container that is rebuilt by
 * deep-copying the template and replaying every override in order:
 *
 *   Unmaterialized --first read--> Materialized
 *   Materialized --override added/updated, reset, load--> Unmaterialized
 *   Materialized --template revision moved--> rebuilt on next read
 *
 * Removing an override patches the affected path of an existing runtime
 * container back to the template value instead of rebuilding it.
 *
 * Writes come in two modes:
 * - Persistent: the value is recorded as an override (or the override is
 *   dropped when the value equals the template's).
 * - Ephemeral: only the runtime container changes; the first ephemeral
 *   write to a path remembers the value it replaced, readable through
 *   get_metadata_value() until the next invalidation.
 *
 * The template must outlive the instance and stay at the same address.
 */

#ifndef STRATUM_INSTANCE_HPP
#define STRATUM_INSTANCE_HPP

#include "stratum/Container.hpp"
#include "stratum/Diff.hpp"
#include "stratum/OrderedMap.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stratum {

class Template;

enum class WriteMode {
    Persistent,  ///< Record an override
    Ephemeral    ///< Change the runtime container only
};

std::string to_string(WriteMode mode);

/// "persistent" / "ephemeral" (case-insensitive); false on unknown names
bool parse_write_mode(const std::string& name, WriteMode& out);

class Instance {
public:
    /**
     * @param parent Template the instance derives from (not owned)
     * @param id Instance id; a random id is generated when empty
     * @param mode Default write mode for set_value()
     */
    explicit Instance(const Template& parent, std::string id = "",
                      WriteMode mode = WriteMode::Persistent);

    /**
     * @brief Instance whose overrides turn the template into working_copy
     *
     * The working copy is only read; the instance does not keep it.
     */
    static Instance from_working_copy(const Template& parent, const Container& working_copy,
                                      std::string id = "",
                                      WriteMode mode = WriteMode::Persistent,
                                      const DiffOptions& options = {});

    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;
    Instance(Instance&&) = default;
    Instance& operator=(Instance&&) = default;

    const std::string& instance_id() const noexcept { return id_; }
    const Template& parent() const noexcept { return *parent_; }

    WriteMode write_mode() const noexcept { return mode_; }
    void set_write_mode(WriteMode mode) noexcept { mode_ = mode; }

    // ========================================================================
    // Reads
    // ========================================================================

    /// Runtime container, rebuilt first when needed
    const Container& container();

    bool is_materialized() const noexcept { return runtime_ != nullptr; }

    /// Current runtime value at path (see Container::path_get)
    template <typename T>
    T get_value(const std::string& path, const T& fallback = T{}) {
        return container().path_get<T>(path, fallback);
    }

    /**
     * @brief Value at path before this session's ephemeral writes
     *
     * Paths never written ephemerally read from the runtime container.
     */
    template <typename T>
    T get_metadata_value(const std::string& path, const T& fallback = T{}) {
        if (const auto* original = original_values_.find(path)) {
            if (!*original) {
                return fallback;
            }
            if (const T* typed = std::get_if<T>(&**original)) {
                return *typed;
            }
            return fallback;
        }
        return get_value<T>(path, fallback);
    }

    // ========================================================================
    // Writes
    // ========================================================================

    /**
     * @brief Write a value using the instance's default mode
     * @throws the exceptions of Container::path_set for unwritable paths
     */
    void set_value(const std::string& path, Value value);

    void set_value(const std::string& path, Value value, WriteMode mode);

    void set_value(const std::string& path, const char* value) {
        set_value(path, Value(std::string(value)));
    }

    /**
     * @brief Drop the override for path
     *
     * A materialized runtime container is patched back to the template
     * value at path (or loses the path when the template has none).
     *
     * @return true if an override was removed
     */
    bool remove_override(const std::string& path);

    /// Drop every override and invalidate
    void reset();

    /// Discard the runtime container; the next read rebuilds it
    void invalidate();

    // ========================================================================
    // Overrides
    // ========================================================================

    const std::vector<OverrideEntry>& overrides() const noexcept { return overrides_; }

    /// Replace the override list (later duplicates of a path win)
    void load_overrides(std::vector<OverrideEntry> entries);

    /// Override values decoded in list order
    OrderedMap<std::string, Value> decoded_overrides() const;

    bool has_override(const std::string& path) const;

    /// True once an ephemeral write touched path since the last invalidation
    bool is_runtime_modified(const std::string& path) const;

    // ========================================================================
    // Persistence
    // ========================================================================

    /// {"instanceId", "parentStructureId", "overrides": [{"path","type","value"}]}
    std::string to_json() const;

    /**
     * @brief Load id and overrides from persisted text
     *
     * Malformed text is logged and leaves the instance unchanged. A
     * parentStructureId naming another template is logged and loaded anyway.
     */
    void from_json(const std::string& text);

private:
    const Template* parent_;
    std::string id_;
    WriteMode mode_;
    std::vector<OverrideEntry> overrides_;
    ContainerPtr runtime_;
    std::uint64_t built_revision_ = 0;
    // Value each ephemerally written path held before its first write (nullopt: absent)
    OrderedMap<std::string, std::optional<Value>> original_values_;

    Container& materialize();
    void rebuild();
    void upsert_override(OverrideEntry entry);
    bool erase_override(const std::string& path);
    void replay_below(const std::string& path);
};

} // namespace stratum

#endif // STRATUM_INSTANCE_HPP
