/**
 * @file Util.hpp
 * @brief String, environment and id helpers shared by the library and CLI
 */

#ifndef STRATUM_UTIL_HPP
#define STRATUM_UTIL_HPP

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace stratum {

// Lowercase (ASCII only)
std::string to_lower(std::string s);

// Strip spaces, tabs, CR and LF from both ends
std::string trim(const std::string& s);

// Split on a delimiter, dropping empty tokens
std::vector<std::string> split(const std::string& s, char delim);

std::string replace_all(std::string s, const std::string& from, const std::string& to);

bool starts_with_icase(const std::string& str, const std::string& prefix);

// Parse an --overrides string: "k1:json, k2:json, ..."
// Commas inside quotes, braces or brackets do not split pairs.
std::map<std::string, nlohmann::json> parse_overrides(const std::string& s);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

// Try parsing string as JSON, otherwise return it as a string.
nlohmann::json parse_json_or_string(const std::string& raw);

// 32 lowercase hex digits, used for template and instance ids
std::string generate_id();

} // namespace stratum

#endif // STRATUM_UTIL_HPP
