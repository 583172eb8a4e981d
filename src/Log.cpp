/**
 * @file Log.cpp
 * @brief Diagnostics seam implementation
 */

#include "stratum/Log.hpp"
#include "stratum/Util.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace stratum {

namespace {

std::shared_ptr<spdlog::logger>& active_logger() {
    static std::shared_ptr<spdlog::logger> instance;
    return instance;
}

std::shared_ptr<spdlog::logger> make_default_logger() {
    auto existing = spdlog::get(kLoggerName);
    if (existing) {
        return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_level(spdlog::level::warn);
    return created;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> logger() {
    auto& current = active_logger();
    if (!current) {
        current = make_default_logger();
    }
    return current;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    active_logger() = std::move(logger);
}

bool set_log_level(const std::string& level) {
    const std::string name = to_lower(trim(level));
    if (name.empty()) {
        return false;
    }
    // spdlog maps unknown names to "off", so check explicitly
    if (name != "off" && spdlog::level::from_str(name) == spdlog::level::off) {
        return false;
    }
    logger()->set_level(spdlog::level::from_str(name));
    return true;
}

} // namespace stratum
