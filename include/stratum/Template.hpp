/**
 * @file Template.hpp
 * @brief Shared baseline container that instances derive from
 *
 * A Template owns its container. Instances keep a pointer to the template
 * and watch its revision counter, rebuilding their runtime container when
 * it moves. The container is read-only through the template; writes go
 * through set_value(), remove_value() or edit(), which bump the revision.
 *
 * A container handed to the constructor may still be shared with the
 * caller. Top-level changes made through that pointer bump the revision
 * too; nested ones need a mark_changed() call.
 *
 * Persisted form:
 * ```json
 * {"structureId": "...", "description": "...", "containerJson": "<wire document>"}
 * ```
 */

#ifndef STRATUM_TEMPLATE_HPP
#define STRATUM_TEMPLATE_HPP

#include "stratum/Container.hpp"
#include "stratum/Diff.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace stratum {

class Instance;

class Template {
public:
    /**
     * @param id Template id; a random id is generated when empty
     * @param description Free text shown by tools
     */
    explicit Template(std::string id = "", std::string description = "");

    /// Wrap an existing container (nullptr starts empty)
    Template(std::string id, std::string description, ContainerPtr container);

    ~Template();

    Template(const Template&) = delete;
    Template& operator=(const Template&) = delete;
    Template(Template&& other) noexcept;
    Template& operator=(Template&& other) noexcept;

    const std::string& id() const noexcept { return id_; }
    const std::string& description() const noexcept { return description_; }
    void set_description(std::string description) { description_ = std::move(description); }

    const Container& container() const { return *container_; }

    /// Write by path and bump the revision
    void set_value(const std::string& path, Value value);

    /**
     * @brief Remove by path and bump the revision
     * @return true if something was removed
     */
    bool remove_value(const std::string& path);

    /**
     * @brief Run fn on the mutable container, then bump the revision
     *
     * The revision moves even when fn throws part way through.
     */
    template <typename Fn>
    void edit(Fn&& fn) {
        try {
            std::forward<Fn>(fn)(*container_);
        } catch (...) {
            mark_changed();
            throw;
        }
        mark_changed();
    }

    /// Bump the revision after edits the template could not observe
    void mark_changed();

    std::uint64_t revision() const noexcept;

    /**
     * @brief New instance seeded by diffing a deep copy of this template
     *
     * With CollectionDiff::Identity every container list and map is
     * recorded as an override; with Structural the instance starts with
     * no overrides.
     *
     * @param instance_id Instance id; a random id is generated when empty
     */
    Instance create_instance(const std::string& instance_id = "",
                             const DiffOptions& options = {}) const;

    /// Independent template with a deep-copied container
    Template deep_copy() const;

    /**
     * @brief Structural sanity check
     *
     * Reports (as warnings) null containers inside collections and cycles.
     */
    bool validate() const;

    /**
     * @brief Every reachable path, depth-first in display order
     *
     * Includes collection keys themselves and their element paths
     * ("items", "items[0]", "items[0].hp").
     */
    std::vector<std::string> all_paths() const;

    /// Type id of the value at path ("container" for the empty path)
    std::optional<std::string> path_type(const std::string& path) const;

    std::string to_json() const;

    /**
     * @brief Replace id, description and container from persisted text
     *
     * Malformed text is logged and leaves the template unchanged.
     */
    void from_json(const std::string& text);

private:
    struct State {
        std::uint64_t revision = 0;
    };

    std::string id_;
    std::string description_;
    ContainerPtr container_;
    std::shared_ptr<State> state_;
    Container::ObserverId observer_id_ = 0;

    void attach(ContainerPtr container);
    void detach();
};

} // namespace stratum

#endif // STRATUM_TEMPLATE_HPP
