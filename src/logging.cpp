#include "logging.hpp"

#include <mutex>
#include <stdexcept>

#include <spdlog/sinks/stdout_sinks.h>

namespace grpsig {
namespace logging {

namespace {

const char* LOG_PATTERN = "%Y-%m-%dT%H:%M:%S.%e|%-5l|%n|%t|%v";

std::mutex registry_mu;

} // namespace

Logger get_logger(const std::string& name) {
    std::lock_guard<std::mutex> lock(registry_mu);
    Logger logger = spdlog::get(name);
    if (logger == nullptr) {
        logger = spdlog::stdout_logger_mt(name);
        logger->set_pattern(LOG_PATTERN);
        logger->set_level(spdlog::get_level());
    }
    return logger;
}

void set_log_level(const std::string& level) {
    spdlog::level::level_enum lvl = spdlog::level::from_str(level);
    // from_str maps anything unknown to "off"
    if (lvl == spdlog::level::off && level != "off") {
        throw std::invalid_argument("unknown log level: " + level);
    }
    std::lock_guard<std::mutex> lock(registry_mu);
    spdlog::set_level(lvl);
}

std::string get_log_level() {
    auto sv = spdlog::level::to_string_view(spdlog::get_level());
    return std::string(sv.data(), sv.size());
}

} // namespace logging
} // namespace grpsig
