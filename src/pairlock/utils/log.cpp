#include "pairlock/utils/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace pairlock::log {

std::shared_ptr<spdlog::logger> logger() {
    static std::once_flag logger_flag;
    static std::shared_ptr<spdlog::logger> instance;
    std::call_once(logger_flag, []() {
        instance = spdlog::get(LOGGER_NAME);
        if (!instance) {
            instance = spdlog::stderr_color_mt(LOGGER_NAME);
            instance->set_level(spdlog::level::info);
        }
    });
    return instance;
}

bool set_level(const std::string &level) {
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (parsed == spdlog::level::off && level != "off") {
        return false;
    }
    logger()->set_level(parsed);
    return true;
}

} // namespace pairlock::log
