/**
 * @file Util.cpp
 * @brief String, environment and id helpers
 */

#include "stratum/Util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <random>

#if defined(_WIN32)
  #define STRATUM_ENVIRON _environ
#else
  extern char **environ;
  #define STRATUM_ENVIRON environ
#endif

namespace stratum {

namespace {

constexpr const char* kBlank = " \t\r\n";

char ascii_upper(char c) {
    return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
}

} // namespace

std::string to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string trim(const std::string& s) {
    const size_t first = s.find_first_not_of(kBlank);
    if (first == std::string::npos) {
        return {};
    }
    const size_t last = s.find_last_not_of(kBlank);
    return s.substr(first, last + 1 - first);
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t begin = 0;
    while (begin <= s.size()) {
        size_t end = s.find(delim, begin);
        if (end == std::string::npos) {
            end = s.size();
        }
        if (end > begin) {
            parts.emplace_back(s, begin, end - begin);
        }
        begin = end + 1;
    }
    return parts;
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return s;
    }
    std::string out;
    out.reserve(s.size());
    size_t cursor = 0;
    for (size_t hit = s.find(from); hit != std::string::npos; hit = s.find(from, cursor)) {
        out.append(s, cursor, hit - cursor);
        out += to;
        cursor = hit + from.size();
    }
    out.append(s, cursor, std::string::npos);
    return out;
}

bool starts_with_icase(const std::string& str, const std::string& prefix) {
    if (str.size() < prefix.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (ascii_upper(str[i]) != ascii_upper(prefix[i])) {
            return false;
        }
    }
    return true;
}

std::map<std::string, nlohmann::json> parse_overrides(const std::string& s) {
    std::map<std::string, nlohmann::json> result;

    // Cut the input into top-level segments first.
    std::vector<std::string> segments;
    std::string current;
    int nesting = 0;
    char quote = '\0';
    char prev = '\0';
    for (char c : s) {
        if (quote != '\0') {
            if (c == quote && prev != '\\') {
                quote = '\0';
            }
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '{' || c == '[') {
            ++nesting;
        } else if (c == '}' || c == ']') {
            --nesting;
        } else if (c == ',' && nesting == 0) {
            segments.push_back(current);
            current.clear();
            prev = c;
            continue;
        }
        current += c;
        prev = c;
    }
    segments.push_back(current);

    for (const auto& segment : segments) {
        const size_t colon = segment.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        const std::string key = trim(segment.substr(0, colon));
        if (!key.empty()) {
            result[key] = parse_json_or_string(trim(segment.substr(colon + 1)));
        }
    }
    return result;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> vars;
    char** entries = STRATUM_ENVIRON;
    if (entries == nullptr) {
        return vars;
    }
    for (; *entries != nullptr; ++entries) {
        const char* entry = *entries;
        const char* eq = std::strchr(entry, '=');
        // Skip malformed entries and the "=C:" style drive markers on Windows
        if (eq == nullptr || eq == entry) {
            continue;
        }
        vars.emplace_back(std::string(entry, eq), std::string(eq + 1));
    }
    return vars;
}

nlohmann::json parse_json_or_string(const std::string& raw) {
    nlohmann::json parsed = nlohmann::json::parse(raw, nullptr, false);
    return parsed.is_discarded() ? nlohmann::json(raw) : parsed;
}

std::string generate_id() {
    static thread_local std::mt19937_64 engine{std::random_device{}()};
    static constexpr char kHex[] = "0123456789abcdef";
    std::string id;
    id.reserve(32);
    for (int word = 0; word < 2; ++word) {
        uint64_t bits = engine();
        for (int i = 0; i < 16; ++i) {
            id += kHex[bits & 0xF];
            bits >>= 4;
        }
    }
    return id;
}

} // namespace stratum
