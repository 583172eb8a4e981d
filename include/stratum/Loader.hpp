/**
 * @file Loader.hpp
 * @brief Reading and writing JSON/TOML documents on disk
 *
 * Used for settings files and by the command-line tool for template and
 * instance documents. The core data model itself never touches files.
 *
 * Format is chosen by extension: ".json" (nlohmann::json) or ".toml"
 * (toml++). TOML tables become JSON objects; dates and times become
 * strings.
 */

#ifndef STRATUM_LOADER_HPP
#define STRATUM_LOADER_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace stratum {

/**
 * @brief Read a whole file as text
 * @throws FileNotFoundError if the file cannot be opened
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Write text to a file, replacing its contents
 * @throws StratumError if the file cannot be opened for writing
 */
void write_text_file(const std::string& path, const std::string& text);

/**
 * @brief Load a JSON file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the JSON syntax is invalid
 */
nlohmann::json load_json_file(const std::string& path);

/**
 * @brief Load a TOML file as JSON
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if the TOML syntax is invalid
 */
nlohmann::json load_toml_file(const std::string& path);

/**
 * @brief Load a document, picking the format from the extension
 *
 * An empty path yields an empty object.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError on syntax errors or an unsupported extension
 */
nlohmann::json load_document_file(const std::string& path);

/**
 * @brief Render a JSON object as TOML text
 *
 * Non-object roots are wrapped under "value". TOML has no null; nulls are
 * written as empty strings.
 */
std::string json_to_toml_string(const nlohmann::json& doc);

/// Lowercased extension including the dot (".json"), empty if none
std::string file_extension(const std::string& path);

} // namespace stratum

#endif // STRATUM_LOADER_HPP
