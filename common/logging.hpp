#ifndef PAGECURL_COMMON_LOGGING_HPP
#define PAGECURL_COMMON_LOGGING_HPP

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

namespace pagecurl {
namespace logging {

constexpr const char* LOGGER_NAME = "pagecurl";
constexpr const char* LEVEL_ENV = "PAGECURL_LOG_LEVEL";

constexpr const char* DEFAULT_PATTERN = "[%H:%M:%S.%e] [%n] [%^%l%$] %v";
constexpr spdlog::level::level_enum DEFAULT_LEVEL = spdlog::level::info;

// Level for a name such as "debug" or "warn". Unknown names give nullopt
// instead of spdlog's silent fallback to off.
inline std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    if (name == "warning") {
        return spdlog::level::warn;
    }
    auto level = spdlog::level::from_str(name);
    if (level == spdlog::level::off && name != "off") {
        return std::nullopt;
    }
    return level;
}

inline std::shared_ptr<spdlog::logger> get_logger() {
    static std::shared_ptr<spdlog::logger> logger = []() {
        auto log = spdlog::stderr_color_mt(LOGGER_NAME);
        log->set_pattern(DEFAULT_PATTERN);
        log->set_level(DEFAULT_LEVEL);
        log->flush_on(spdlog::level::warn);

        if (const char* level_env = std::getenv(LEVEL_ENV)) {
            if (auto level = parse_level(level_env)) {
                log->set_level(*level);
            } else {
                log->warn("Ignoring unknown {} '{}'", LEVEL_ENV, level_env);
            }
        }

        return log;
    }();
    return logger;
}

// True when the level was taken from the environment
inline bool level_from_environment() {
    const char* level_env = std::getenv(LEVEL_ENV);
    return level_env != nullptr && parse_level(level_env).has_value();
}

}  // namespace logging
}  // namespace pagecurl

#endif // PAGECURL_COMMON_LOGGING_HPP
