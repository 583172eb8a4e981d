/**
 * @file Loader.cpp
 * @brief JSON/TOML file loading and TOML rendering
 */

#include "stratum/Loader.hpp"
#include "stratum/Errors.hpp"
#include "stratum/Util.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace stratum {

namespace {

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

// TOML dates and times have no JSON counterpart; they are kept as their
// TOML text.
template <typename T>
nlohmann::json temporal_text(const T& value) {
    std::ostringstream text;
    text << value;
    return text.str();
}

nlohmann::json toml_to_json(const toml::node& node) {
    if (const auto* table = node.as_table()) {
        nlohmann::json obj = nlohmann::json::object();
        for (const auto& [key, child] : *table) {
            obj[std::string(key.str())] = toml_to_json(child);
        }
        return obj;
    }
    if (const auto* array = node.as_array()) {
        nlohmann::json arr = nlohmann::json::array();
        for (const toml::node& child : *array) {
            arr.push_back(toml_to_json(child));
        }
        return arr;
    }
    if (auto s = node.as_string()) return s->get();
    if (auto i = node.as_integer()) return i->get();
    if (auto f = node.as_floating_point()) return f->get();
    if (auto b = node.as_boolean()) return b->get();
    if (auto d = node.as_date()) return temporal_text(d->get());
    if (auto t = node.as_time()) return temporal_text(t->get());
    if (auto dt = node.as_date_time()) return temporal_text(dt->get());
    return nullptr;
}

// JSON -> TOML. Nulls become empty strings and unsigned values past
// int64 range are stored as floats.
void json_into_toml_array(toml::array& out, const nlohmann::json& value);
void json_into_toml_table(toml::table& out, const std::string& key, const nlohmann::json& value);

toml::table toml_table_of(const nlohmann::json& obj) {
    toml::table out;
    for (const auto& item : obj.items()) {
        json_into_toml_table(out, item.key(), item.value());
    }
    return out;
}

toml::array toml_array_of(const nlohmann::json& arr) {
    toml::array out;
    for (const auto& element : arr) {
        json_into_toml_array(out, element);
    }
    return out;
}

template <typename Emit>
void emit_json(const nlohmann::json& value, Emit&& emit) {
    switch (value.type()) {
        case nlohmann::json::value_t::object:
            emit(toml_table_of(value));
            break;
        case nlohmann::json::value_t::array:
            emit(toml_array_of(value));
            break;
        case nlohmann::json::value_t::string:
            emit(value.get<std::string>());
            break;
        case nlohmann::json::value_t::boolean:
            emit(value.get<bool>());
            break;
        case nlohmann::json::value_t::number_integer:
            emit(value.get<std::int64_t>());
            break;
        case nlohmann::json::value_t::number_unsigned: {
            const std::uint64_t u = value.get<std::uint64_t>();
            constexpr auto kMax = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
            if (u > kMax) {
                emit(static_cast<double>(u));
            } else {
                emit(static_cast<std::int64_t>(u));
            }
            break;
        }
        case nlohmann::json::value_t::number_float:
            emit(value.get<double>());
            break;
        default:
            emit(std::string{});
            break;
    }
}

void json_into_toml_array(toml::array& out, const nlohmann::json& value) {
    emit_json(value, [&out](auto&& v) { out.push_back(std::forward<decltype(v)>(v)); });
}

void json_into_toml_table(toml::table& out, const std::string& key, const nlohmann::json& value) {
    emit_json(value, [&out, &key](auto&& v) { out.insert(key, std::forward<decltype(v)>(v)); });
}

} // anonymous namespace

std::string file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

std::string read_text_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

void write_text_file(const std::string& path, const std::string& text) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw StratumError("Failed to open for write: " + path);
    }
    file << text;
    if (!file) {
        throw StratumError("Failed to write: " + path);
    }
}

nlohmann::json load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    const std::string content = read_text_file(path);
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw DocumentParseError(path, 0, 0, e.what());
    }
}

nlohmann::json load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw DocumentParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
    return toml_to_json(table);
}

nlohmann::json load_document_file(const std::string& path) {
    if (path.empty()) {
        return nlohmann::json::object();
    }
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw DocumentParseError(path, 0, 0,
                             "unsupported file type '" + ext + "' (expected .json or .toml)");
}

std::string json_to_toml_string(const nlohmann::json& doc) {
    toml::table root = doc.is_object() ? toml_table_of(doc) : toml::table{};
    if (!doc.is_object()) {
        json_into_toml_table(root, "value", doc);
    }
    std::ostringstream oss;
    oss << root;
    return oss.str();
}

} // namespace stratum
