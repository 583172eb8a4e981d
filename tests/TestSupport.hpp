/**
 * @file TestSupport.hpp
 * @brief Shared fixtures for the stratum tests
 */

#ifndef STRATUM_TESTS_TESTSUPPORT_HPP
#define STRATUM_TESTS_TESTSUPPORT_HPP

#include "stratum/Log.hpp"

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

namespace stratum_test {

namespace fs = std::filesystem;

/**
 * @brief RAII wrapper for temporary files
 */
class TempFile {
public:
    TempFile(const std::string& filename, const std::string& content)
        : path_(fs::temp_directory_path() / filename) {
        std::ofstream f(path_);
        f << content;
    }

    /// Reserve a path without creating the file
    explicit TempFile(const std::string& filename)
        : path_(fs::temp_directory_path() / filename) {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;

    std::string path() const { return path_.string(); }

    std::string read() const {
        std::ifstream f(path_);
        return std::string(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    }

private:
    fs::path path_;
};

/**
 * @brief RAII wrapper for an environment variable
 */
class EnvGuard {
public:
    EnvGuard(const std::string& name, const std::string& value)
        : name_(name) {
        if (const char* old = std::getenv(name.c_str())) {
            old_value_ = old;
            had_value_ = true;
        }
        setenv(name.c_str(), value.c_str(), 1);
    }

    ~EnvGuard() {
        if (had_value_) {
            setenv(name_.c_str(), old_value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;

private:
    std::string name_;
    std::string old_value_;
    bool had_value_ = false;
};

/**
 * @brief Routes stratum diagnostics into memory for the lifetime of the object
 */
class LogCapture {
public:
    LogCapture()
        : previous_(stratum::logger())
        , sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)) {
        sink_->set_pattern("%l %v");
        auto captured = std::make_shared<spdlog::logger>("stratum_test", sink_);
        captured->set_level(spdlog::level::trace);
        stratum::set_logger(std::move(captured));
    }

    ~LogCapture() {
        stratum::set_logger(previous_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<std::string> lines() const { return sink_->last_formatted(); }

    /// True if some message at the given level contains text
    bool contains(const std::string& level, const std::string& text) const {
        for (const auto& line : lines()) {
            if (line.rfind(level + " ", 0) == 0 && line.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    std::shared_ptr<spdlog::logger> previous_;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

} // namespace stratum_test

#endif // STRATUM_TESTS_TESTSUPPORT_HPP
