#pragma once

#include "types.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace ari::logging
{

    /**
     * Configure the default spdlog sink and level. Called once by the
     * process entry point; components only ask for named loggers.
     */
    Result<void> init(const std::string &level, const std::string &pattern = "[%Y-%m-%dT%H:%M:%S.%e] [%n] [%l] %v");

    Result<spdlog::level::level_enum> parse_level(const std::string &level);

    /** Named logger sharing the default logger's sinks, created on first use. */
    std::shared_ptr<spdlog::logger> get(const std::string &component);

} // namespace ari::logging
