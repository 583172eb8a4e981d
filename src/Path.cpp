/**
 * @file Path.cpp
 * @brief Path parser and path-string helpers
 */

#include "stratum/Path.hpp"
#include "stratum/Errors.hpp"

#include <cctype>
#include <limits>
#include <utility>

namespace stratum {

Segment Segment::property(std::string name) {
    Segment seg;
    seg.kind = SegmentKind::Property;
    seg.name = std::move(name);
    return seg;
}

Segment Segment::list_index(std::size_t index) {
    Segment seg;
    seg.kind = SegmentKind::ListIndex;
    seg.index = index;
    return seg;
}

Segment Segment::map_key(std::string key) {
    Segment seg;
    seg.kind = SegmentKind::MapKey;
    seg.name = std::move(key);
    return seg;
}

bool Segment::operator==(const Segment& other) const {
    if (kind != other.kind) return false;
    if (kind == SegmentKind::ListIndex) return index == other.index;
    return name == other.name;
}

// ============================================================================
// Parser
// ============================================================================

namespace {

class PathParser {
public:
    explicit PathParser(const std::string& text) : text_(text) {}

    Path parse() {
        Path segments;
        if (text_.empty()) {
            return segments;
        }

        if (text_[0] == '[') {
            // Relative continuation of an enclosing path
            segments.push_back(parse_accessor());
            expect_separator_or_end();
        } else {
            parse_group(segments);
        }

        while (pos_ < text_.size()) {
            ++pos_;  // '.'
            parse_group(segments);
        }
        return segments;
    }

private:
    const std::string& text_;
    std::size_t pos_ = 0;

    [[noreturn]] void fail(std::size_t position, const std::string& details) const {
        throw PathSyntaxError(text_, position, details);
    }

    void parse_group(Path& segments) {
        const std::size_t start = pos_;
        while (pos_ < text_.size()) {
            const char c = text_[pos_];
            if (c == '.' || c == '[' || c == ']') break;
            ++pos_;
        }
        if (pos_ == start) {
            fail(start, "expected identifier");
        }
        segments.push_back(Segment::property(text_.substr(start, pos_ - start)));

        if (pos_ < text_.size() && text_[pos_] == '[') {
            segments.push_back(parse_accessor());
        }
        expect_separator_or_end();
    }

    void expect_separator_or_end() const {
        if (pos_ >= text_.size() || text_[pos_] == '.') {
            return;
        }
        if (text_[pos_] == '[') {
            fail(pos_, "only one accessor may follow a property");
        }
        fail(pos_, std::string("unexpected character '") + text_[pos_] + "'");
    }

    Segment parse_accessor() {
        const std::size_t open = pos_;
        ++pos_;  // '['
        if (pos_ >= text_.size()) {
            fail(open, "unterminated '['");
        }
        if (text_[pos_] == '"') {
            return parse_quoted_key(open);
        }
        return parse_index(open);
    }

    Segment parse_quoted_key(std::size_t open) {
        ++pos_;  // opening quote
        std::string key;
        bool closed = false;
        while (pos_ < text_.size()) {
            const char c = text_[pos_++];
            if (c == '\\') {
                if (pos_ >= text_.size()) {
                    fail(pos_ - 1, "dangling escape in quoted key");
                }
                const char escaped = text_[pos_++];
                if (escaped != '"' && escaped != '\\') {
                    fail(pos_ - 2, std::string("unsupported escape '\\") + escaped + "'");
                }
                key += escaped;
            } else if (c == '"') {
                closed = true;
                break;
            } else {
                key += c;
            }
        }
        if (!closed) {
            fail(open, "unterminated quoted key");
        }
        if (pos_ >= text_.size() || text_[pos_] != ']') {
            fail(pos_, "expected ']' after quoted key");
        }
        ++pos_;
        return Segment::map_key(std::move(key));
    }

    Segment parse_index(std::size_t open) {
        const std::size_t start = pos_;
        std::size_t index = 0;
        constexpr auto max_index = std::numeric_limits<std::size_t>::max();
        while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_]))) {
            const std::size_t digit = static_cast<std::size_t>(text_[pos_] - '0');
            if (index > (max_index - digit) / 10) {
                fail(start, "list index out of range");
            }
            index = index * 10 + digit;
            ++pos_;
        }
        if (pos_ >= text_.size()) {
            fail(open, "unterminated '['");
        }
        if (pos_ == start || text_[pos_] != ']') {
            fail(start, "accessor must be a non-negative integer or a quoted key");
        }
        ++pos_;
        return Segment::list_index(index);
    }
};

} // anonymous namespace

Path parse_path(const std::string& path) {
    return PathParser(path).parse();
}

std::optional<Path> try_parse_path(const std::string& path) {
    try {
        return parse_path(path);
    } catch (const PathSyntaxError&) {
        return std::nullopt;
    }
}

// ============================================================================
// Formatting
// ============================================================================

std::string quote_map_key(const std::string& key) {
    std::string out = "\"";
    for (char c : key) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

std::string to_string(const Segment& segment) {
    switch (segment.kind) {
        case SegmentKind::Property:
            return segment.name;
        case SegmentKind::ListIndex:
            return "[" + std::to_string(segment.index) + "]";
        case SegmentKind::MapKey:
            return "[" + quote_map_key(segment.name) + "]";
    }
    return segment.name;
}

std::string format_path(const Path& segments) {
    std::string out;
    for (const auto& segment : segments) {
        if (segment.kind == SegmentKind::Property && !out.empty()) {
            out += '.';
        }
        out += to_string(segment);
    }
    return out;
}

// ============================================================================
// Path-string helpers
// ============================================================================

std::string combine_path(const std::string& parent, const std::string& key) {
    if (parent.empty()) return key;
    return parent + "." + key;
}

std::string combine_list_item_path(const std::string& parent, std::size_t index) {
    return parent + "[" + std::to_string(index) + "]";
}

std::string combine_map_item_path(const std::string& parent, const std::string& key) {
    return parent + "[" + quote_map_key(key) + "]";
}

std::string parent_path(const std::string& path) {
    Path segments = parse_path(path);
    if (segments.empty()) return "";
    segments.pop_back();
    return format_path(segments);
}

std::string path_key(const std::string& path) {
    const Path segments = parse_path(path);
    if (segments.empty()) return "";
    const Segment& last = segments.back();
    if (last.kind == SegmentKind::ListIndex) {
        return std::to_string(last.index);
    }
    return last.name;
}

bool is_list_index_path(const std::string& path) {
    auto segments = try_parse_path(path);
    return segments && !segments->empty() && segments->back().kind == SegmentKind::ListIndex;
}

bool is_map_key_path(const std::string& path) {
    auto segments = try_parse_path(path);
    return segments && !segments->empty() && segments->back().kind == SegmentKind::MapKey;
}

std::string join_relative_path(const std::string& base, const std::string& relative) {
    if (relative.empty()) return base;
    if (base.empty()) return relative;
    if (relative[0] == '[') return base + relative;
    return base + "." + relative;
}

} // namespace stratum
