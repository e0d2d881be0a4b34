#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace pairlock::log {

    inline constexpr const char *LOGGER_NAME = "pairlock";

    // Shared library logger, created on first use
    std::shared_ptr<spdlog::logger> logger();

    // Accepts spdlog level names ("trace" ... "off"). Returns false for unknown names.
    bool set_level(const std::string &level);

} // namespace pairlock::log
