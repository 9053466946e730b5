#ifndef GRPSIG_LOGGING_HPP
#define GRPSIG_LOGGING_HPP

#include <memory>
#include <sstream>
#include <string>

#include <spdlog/spdlog.h>

namespace grpsig {
namespace logging {

using Logger = std::shared_ptr<spdlog::logger>;

// Returns the named logger, creating it (stdout sink) on first use.
Logger get_logger(const std::string& name);

// Applies a level ("trace", "debug", "info", "warn", "error", "critical",
// "off") to every logger, current and future. Throws std::invalid_argument
// on an unknown name.
void set_log_level(const std::string& level);

std::string get_log_level();

} // namespace logging
} // namespace grpsig

#define LOG_TRACE(l, s)                            \
    {                                              \
        if (l->should_log(spdlog::level::trace)) { \
            std::ostringstream ss;                 \
            ss << s;                               \
            l->trace(ss.str());                    \
        }                                          \
    }
#define LOG_DEBUG(l, s)                            \
    {                                              \
        if (l->should_log(spdlog::level::debug)) { \
            std::ostringstream ss;                 \
            ss << s;                               \
            l->debug(ss.str());                    \
        }                                          \
    }
#define LOG_INFO(l, s)                            \
    {                                             \
        if (l->should_log(spdlog::level::info)) { \
            std::ostringstream ss;                \
            ss << s;                              \
            l->info(ss.str());                    \
        }                                         \
    }
#define LOG_WARN(l, s)                            \
    {                                             \
        if (l->should_log(spdlog::level::warn)) { \
            std::ostringstream ss;                \
            ss << s;                              \
            l->warn(ss.str());                    \
        }                                         \
    }
#define LOG_ERROR(l, s)                          \
    {                                            \
        if (l->should_log(spdlog::level::err)) { \
            std::ostringstream ss;               \
            ss << s;                             \
            l->error(ss.str());                  \
        }                                        \
    }

#endif // GRPSIG_LOGGING_HPP
