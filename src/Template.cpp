/**
 * @file Template.cpp
 * @brief Template ownership, revision tracking and persistence
 */

#include "stratum/Template.hpp"
#include "stratum/Instance.hpp"
#include "stratum/Log.hpp"
#include "stratum/Util.hpp"

#include <nlohmann/json.hpp>
#include <unordered_set>

namespace stratum {

namespace {

using ActiveSet = std::unordered_set<const Container*>;

void collect_paths(const Container& container, const std::string& prefix,
                   std::vector<std::string>& out, ActiveSet& active);

void collect_element(const ContainerPtr& element, const std::string& path,
                     std::vector<std::string>& out, ActiveSet& active) {
    out.push_back(path);
    if (element && active.count(element.get()) == 0) {
        collect_paths(*element, path, out, active);
    }
}

void collect_paths(const Container& container, const std::string& prefix,
                   std::vector<std::string>& out, ActiveSet& active) {
    active.insert(&container);
    for (const auto& [key, value] : container.entries()) {
        const std::string path = combine_path(prefix, key);
        out.push_back(path);
        if (const auto* child = std::get_if<ContainerPtr>(&value)) {
            if (*child && active.count(child->get()) == 0) {
                collect_paths(**child, path, out, active);
            }
        } else if (const auto* list = std::get_if<ContainerList>(&value)) {
            for (std::size_t i = 0; i < list->size(); ++i) {
                collect_element((*list)[i], combine_list_item_path(path, i), out, active);
            }
        } else if (const auto* map = std::get_if<ContainerMap>(&value)) {
            for (const auto& [item_key, item] : *map) {
                collect_element(item, combine_map_item_path(path, item_key), out, active);
            }
        }
    }
    active.erase(&container);
}

bool validate_container(const Container& container, const std::string& prefix,
                        ActiveSet& active) {
    active.insert(&container);
    bool ok = true;
    auto check_element = [&](const ContainerPtr& element, const std::string& path) {
        if (!element) {
            logger()->warn("Template::validate: null container at '{}'", path);
            ok = false;
        } else if (active.count(element.get()) > 0) {
            logger()->warn("Template::validate: '{}' refers back to an enclosing container", path);
            ok = false;
        } else {
            ok = validate_container(*element, path, active) && ok;
        }
    };

    for (const auto& [key, value] : container.entries()) {
        const std::string path = combine_path(prefix, key);
        if (const auto* child = std::get_if<ContainerPtr>(&value)) {
            check_element(*child, path);
        } else if (const auto* list = std::get_if<ContainerList>(&value)) {
            for (std::size_t i = 0; i < list->size(); ++i) {
                check_element((*list)[i], combine_list_item_path(path, i));
            }
        } else if (const auto* map = std::get_if<ContainerMap>(&value)) {
            for (const auto& [item_key, item] : *map) {
                check_element(item, combine_map_item_path(path, item_key));
            }
        }
    }
    active.erase(&container);
    return ok;
}

} // anonymous namespace

Template::Template(std::string id, std::string description)
    : Template(std::move(id), std::move(description), nullptr) {}

Template::Template(std::string id, std::string description, ContainerPtr container)
    : id_(std::move(id))
    , description_(std::move(description))
    , state_(std::make_shared<State>()) {
    if (id_.empty()) {
        id_ = generate_id();
    }
    attach(std::move(container));
}

Template::~Template() {
    detach();
}

Template::Template(Template&& other) noexcept
    : id_(std::move(other.id_))
    , description_(std::move(other.description_))
    , container_(std::move(other.container_))
    , state_(std::move(other.state_))
    , observer_id_(other.observer_id_) {
    other.observer_id_ = 0;
}

Template& Template::operator=(Template&& other) noexcept {
    if (this != &other) {
        detach();
        id_ = std::move(other.id_);
        description_ = std::move(other.description_);
        container_ = std::move(other.container_);
        state_ = std::move(other.state_);
        observer_id_ = other.observer_id_;
        other.observer_id_ = 0;
    }
    return *this;
}

void Template::attach(ContainerPtr container) {
    container_ = container ? std::move(container) : std::make_shared<Container>();
    std::shared_ptr<State> state = state_;
    observer_id_ = container_->add_observer(
        [state](const std::string&, const Value&, const Value&) { ++state->revision; });
}

void Template::detach() {
    if (container_ && observer_id_ != 0) {
        container_->remove_observer(observer_id_);
    }
    observer_id_ = 0;
}

void Template::set_value(const std::string& path, Value value) {
    container_->path_set(path, std::move(value));
    mark_changed();
}

bool Template::remove_value(const std::string& path) {
    const bool removed = container_->path_remove(path);
    if (removed) {
        mark_changed();
    }
    return removed;
}

void Template::mark_changed() {
    ++state_->revision;
}

std::uint64_t Template::revision() const noexcept {
    return state_ ? state_->revision : 0;
}

Instance Template::create_instance(const std::string& instance_id,
                                   const DiffOptions& options) const {
    ContainerPtr working = container_->deep_copy();
    return Instance::from_working_copy(*this, *working, instance_id,
                                       WriteMode::Persistent, options);
}

Template Template::deep_copy() const {
    return Template(id_, description_, container_->deep_copy());
}

bool Template::validate() const {
    if (!container_) {
        logger()->warn("Template::validate: template '{}' has no container", id_);
        return false;
    }
    ActiveSet active;
    return validate_container(*container_, "", active);
}

std::vector<std::string> Template::all_paths() const {
    std::vector<std::string> out;
    ActiveSet active;
    collect_paths(*container_, "", out, active);
    return out;
}

std::optional<std::string> Template::path_type(const std::string& path) const {
    if (path.empty()) {
        return std::string(ValueTraits<ContainerPtr>::type_id);
    }
    auto found = container_->path_find(path);
    if (!found) {
        return std::nullopt;
    }
    return type_id(*found);
}

std::string Template::to_json() const {
    nlohmann::ordered_json doc = {
        {"structureId", id_},
        {"description", description_},
        {"containerJson", container_->to_wire_format()}
    };
    return doc.dump(2);
}

void Template::from_json(const std::string& text) {
    if (trim(text).empty()) {
        return;
    }
    const auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        logger()->error("Template::from_json: malformed template document; template unchanged");
        return;
    }

    auto read_string = [&doc](const char* field) -> std::optional<std::string> {
        auto it = doc.find(field);
        if (it == doc.end() || !it->is_string()) return std::nullopt;
        return it->get<std::string>();
    };

    if (auto id = read_string("structureId"); id && !id->empty()) {
        id_ = *id;
    }
    if (auto description = read_string("description")) {
        description_ = *description;
    }
    if (auto container_json = read_string("containerJson"); container_json && !container_json->empty()) {
        detach();
        attach(Container::from_wire_format(*container_json));
        mark_changed();
    }
}

} // namespace stratum
