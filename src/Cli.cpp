/**
 * @file Cli.cpp
 * @brief Command dispatch for the stratum tool
 */

#include "stratum/Cli.hpp"
#include "stratum/Codec.hpp"
#include "stratum/Errors.hpp"
#include "stratum/Instance.hpp"
#include "stratum/Loader.hpp"
#include "stratum/Log.hpp"
#include "stratum/Settings.hpp"
#include "stratum/Template.hpp"
#include "stratum/Util.hpp"

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <limits>
#include <vector>

namespace stratum {

namespace {

const char* const kCommandSummary =
    "Commands: paths | get PATH | set PATH VALUE [--type T] | reset [PATH] | "
    "overrides | dump [--to json|toml] | diff OTHER";

/// Either a template document ({"containerJson": ...}) or a bare wire document
void load_template_file(Template& tmpl, const std::string& path) {
    const std::string text = read_text_file(path);
    const auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw DocumentParseError(path, 0, 0, "expected a template or container document");
    }
    if (doc.contains("containerJson")) {
        tmpl.from_json(text);
    } else if (doc.contains("data")) {
        tmpl.from_json(nlohmann::json{{"containerJson", text}}.dump());
    } else {
        throw DocumentParseError(path, 0, 0, "document has neither 'containerJson' nor 'data'");
    }
}

ContainerPtr load_container_file(const std::string& path) {
    const std::string text = read_text_file(path);
    const auto doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        throw DocumentParseError(path, 0, 0, "expected a template or container document");
    }
    auto it = doc.find("containerJson");
    if (it != doc.end()) {
        if (!it->is_string()) {
            throw DocumentParseError(path, 0, 0, "'containerJson' must be a string");
        }
        return Container::from_wire_format(it->get<std::string>());
    }
    return Container::from_wire_format(text);
}

std::string render(const nlohmann::ordered_json& doc, const std::string& format, int indent) {
    if (format == "toml") {
        return json_to_toml_string(nlohmann::json::parse(doc.dump()));
    }
    return doc.dump(indent);
}

} // namespace

Value parse_cli_value(const std::string& raw, const std::optional<std::string>& type_id) {
    if (type_id) {
        return deserialize_value(raw, *type_id);
    }

    const nlohmann::json parsed = parse_json_or_string(raw);
    if (parsed.is_boolean()) {
        return parsed.get<bool>();
    }
    if (parsed.is_number_integer()) {
        if (parsed.is_number_unsigned()) {
            const auto n = parsed.get<std::uint64_t>();
            if (n <= static_cast<std::uint64_t>(std::numeric_limits<std::int32_t>::max())) {
                return static_cast<std::int32_t>(n);
            }
            if (n <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<std::int64_t>(n);
            }
            return static_cast<double>(n);
        }
        const auto n = parsed.get<std::int64_t>();
        if (n >= std::numeric_limits<std::int32_t>::min() &&
            n <= std::numeric_limits<std::int32_t>::max()) {
            return static_cast<std::int32_t>(n);
        }
        return n;
    }
    if (parsed.is_number_float()) {
        return parsed.get<double>();
    }
    if (parsed.is_string()) {
        return parsed.get<std::string>();
    }
    return raw;
}

int run_cli(int argc, const char* const* argv, std::ostream& out, std::ostream& err) {
    try {
        cxxopts::Options options("stratum", "Inspect templates and edit instance overrides by path");
        options.positional_help("COMMAND [ARGS]");

        options.add_options()
            ("t,template", "Template or container document (JSON)", cxxopts::value<std::string>())
            ("i,instance", "Instance document holding overrides (JSON)", cxxopts::value<std::string>())
            ("s,settings", "Settings file (JSON/TOML)", cxxopts::value<std::string>())
            ("p,prefix", "Env-var prefix for settings", cxxopts::value<std::string>()->default_value("STRATUM"))
            ("overrides", "Comma-separated dot.key:JSON_value settings overrides",
             cxxopts::value<std::string>()->default_value(""))
            ("type", "Type id for the value given to 'set'", cxxopts::value<std::string>())
            ("to", "Output format for 'dump' (json|toml)", cxxopts::value<std::string>())
            ("h,help", "Show help");

        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());
        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            out << options.help() << "\n" << kCommandSummary << "\n";
            return 0;
        }

        LoadOptions load;
        if (result.count("settings")) load.file_path = result["settings"].as<std::string>();
        load.prefix = result["prefix"].as<std::string>();
        load.overrides = parse_overrides(result["overrides"].as<std::string>());
        const Settings settings = load_settings(load);
        apply_settings(settings);

        const auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string& cmd = cmdv[0];

        auto expect_args = [&](std::size_t want) {
            if (cmdv.size() < want) {
                throw InvalidArgumentError("command", "insufficient arguments for '" + cmd + "'");
            }
        };

        if (!result.count("template")) {
            throw InvalidArgumentError("template", "--template must be provided");
        }
        Template tmpl;
        load_template_file(tmpl, result["template"].as<std::string>());

        std::optional<std::string> instance_path;
        if (result.count("instance")) instance_path = result["instance"].as<std::string>();

        Instance instance(tmpl, "", settings.write_mode);
        if (instance_path && std::filesystem::exists(*instance_path)) {
            instance.from_json(read_text_file(*instance_path));
        }

        auto save_instance = [&]() {
            if (!instance_path) {
                throw InvalidArgumentError("instance", "--instance must be provided for '" + cmd + "'");
            }
            write_text_file(*instance_path, instance.to_json());
        };

        // PATHS
        if (cmd == "paths") {
            for (const auto& path : tmpl.all_paths()) {
                out << path << "\t" << tmpl.path_type(path).value_or("null") << "\n";
            }
            return 0;
        }

        // GET
        if (cmd == "get") {
            expect_args(2);
            const Value value = instance.container().path_value(cmdv[1]);
            out << value_to_plain_json(value).dump(settings.dump_indent) << "\n";
            return 0;
        }

        // SET
        if (cmd == "set") {
            expect_args(3);
            const std::string& path = cmdv[1];
            std::optional<std::string> type;
            if (result.count("type")) {
                type = result["type"].as<std::string>();
            } else if (auto existing = tmpl.path_type(path);
                       existing && is_known_type_id(*existing) && *existing != "container" &&
                       *existing != "container_list" && *existing != "container_map" &&
                       *existing != "null") {
                type = existing;
            }
            Value value = parse_cli_value(cmdv[2], type);
            const std::string stored_type = type_id(value);
            instance.set_value(path, std::move(value), WriteMode::Persistent);
            save_instance();
            out << "Set " << path << " (" << stored_type << ") in " << *instance_path << "\n";
            return 0;
        }

        // RESET
        if (cmd == "reset") {
            if (cmdv.size() >= 2) {
                if (!instance.remove_override(cmdv[1])) {
                    err << "No override at: " << cmdv[1] << "\n";
                    return 1;
                }
            } else {
                instance.reset();
            }
            save_instance();
            return 0;
        }

        // OVERRIDES
        if (cmd == "overrides") {
            for (const auto& entry : instance.overrides()) {
                out << entry.path << "\t" << entry.type << "\t" << entry.value << "\n";
            }
            return 0;
        }

        // DUMP
        if (cmd == "dump") {
            std::string format = result.count("to") ? to_lower(result["to"].as<std::string>())
                                                    : settings.dump_format;
            if (format != "json" && format != "toml") {
                throw InvalidArgumentError("to", "expected 'json' or 'toml', got '" + format + "'");
            }
            out << render(instance.container().to_plain_json(), format, settings.dump_indent) << "\n";
            return 0;
        }

        // DIFF
        if (cmd == "diff") {
            expect_args(2);
            ContainerPtr other = load_container_file(cmdv[1]);
            Instance diffed = Instance::from_working_copy(tmpl, *other, "", settings.write_mode,
                                                          settings.diff_options());
            out << diffed.to_json() << "\n";
            return 0;
        }

        err << "Unknown command: " << cmd << "\n" << kCommandSummary << "\n";
        return 1;

    } catch (const StratumError& ex) {
        err << "Error: " << ex.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        err << "Error: " << ex.what() << "\n";
        return 1;
    }
}

} // namespace stratum
