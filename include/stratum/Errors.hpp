/**
 * @file Errors.hpp
 * @brief Exception types for stratum data errors
 *
 * Error taxonomy:
 * - StratumError: Base class
 * - InvalidArgumentError: Empty key/path, relative path at top level, null container
 * - PathSyntaxError: Malformed path text
 * - PathTypeError: Non-Container value written at a list/map terminal segment
 * - PathNavigationError: Strict lookup of a path that does not resolve
 * - FileNotFoundError: Document or settings file not found
 * - DocumentParseError: JSON/TOML syntax or shape errors
 *
 * Type mismatches on reads, codec failures and override replay failures
 * are recovered locally (logged, default returned) and never thrown.
 */

#ifndef STRATUM_ERRORS_HPP
#define STRATUM_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <cstddef>
#include <utility>

namespace stratum {

/**
 * @brief Base class for all stratum exceptions
 */
class StratumError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief An argument that an operation requires was empty or unusable
 */
class InvalidArgumentError : public StratumError {
public:
    /**
     * @brief Construct with argument name and details
     * @param argument Name of the offending argument (e.g., "key", "path")
     * @param details Why the argument was rejected
     */
    InvalidArgumentError(std::string argument, std::string details)
        : StratumError("Invalid argument '" + argument + "': " + details)
        , argument_(std::move(argument))
        , details_(std::move(details))
    {}

    const std::string& argument() const noexcept {
        return argument_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string argument_;
    std::string details_;
};

/**
 * @brief Path text could not be parsed
 */
class PathSyntaxError : public StratumError {
public:
    /**
     * @brief Construct with path, failing position and details
     * @param path The full path text
     * @param position Zero-based character offset where parsing failed
     * @param details Description of the problem
     */
    PathSyntaxError(std::string path, std::size_t position, std::string details)
        : StratumError("Invalid path '" + path + "' at position " +
                       std::to_string(position) + ": " + details)
        , path_(std::move(path))
        , position_(position)
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    std::size_t position() const noexcept {
        return position_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string path_;
    std::size_t position_;
    std::string details_;
};

/**
 * @brief A value of the wrong kind was written at a path
 *
 * Raised when a non-Container value is set at a list index or map key
 * terminal segment; only Containers live inside collections.
 */
class PathTypeError : public StratumError {
public:
    /**
     * @brief Construct with path, expected type, and actual type
     * @param path Full path being written
     * @param expected Expected type id (e.g., "container")
     * @param actual Actual type id supplied (e.g., "int")
     */
    PathTypeError(std::string path, std::string expected, std::string actual)
        : StratumError("Cannot store " + actual + " (expected " + expected +
                       ") at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief A path segment did not resolve during strict lookup
 */
class PathNavigationError : public StratumError {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full path being accessed (e.g., "stats.hp")
     * @param segment Text of the segment that did not resolve (e.g., "hp")
     */
    PathNavigationError(std::string path, std::string segment)
        : StratumError("Path segment not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Document or settings file not found
 */
class FileNotFoundError : public StratumError {
public:
    explicit FileNotFoundError(std::string path)
        : StratumError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document parse error (JSON/TOML syntax, or unexpected shape)
 */
class DocumentParseError : public StratumError {
public:
    /**
     * @brief Construct with file path, location and details
     * @param file Path to the file (or a label for in-memory text)
     * @param line Line number, 0 when unknown
     * @param column Column number, 0 when unknown
     * @param details Detailed error message from the parser
     */
    DocumentParseError(std::string file, int line, int column, std::string details)
        : StratumError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) msg += ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

} // namespace stratum

#endif // STRATUM_ERRORS_HPP
