#include "ari/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <mutex>
#include <format>

namespace ari::logging
{

    namespace
    {
        std::mutex registry_mutex;
    }

    Result<spdlog::level::level_enum> parse_level(const std::string &level)
    {
        auto parsed = spdlog::level::from_str(level);
        // from_str maps unknown names to "off"
        if (parsed == spdlog::level::off && level != "off")
        {
            return std::unexpected(AriError::config(std::format("Unknown log level: {}", level)));
        }
        return parsed;
    }

    Result<void> init(const std::string &level, const std::string &pattern)
    {
        auto parsed = parse_level(level);
        if (!parsed)
            return std::unexpected(parsed.error());

        {
            // Diagnostics go to stderr so command output on stdout stays parseable
            std::lock_guard lock(registry_mutex);
            if (!spdlog::get("ari"))
            {
                auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                spdlog::set_default_logger(std::make_shared<spdlog::logger>("ari", sink));
            }
        }
        spdlog::set_level(*parsed);
        spdlog::set_pattern(pattern);
        return {};
    }

    std::shared_ptr<spdlog::logger> get(const std::string &component)
    {
        std::lock_guard lock(registry_mutex);
        if (auto existing = spdlog::get(component))
            return existing;

        auto base = spdlog::default_logger();
        auto logger = std::make_shared<spdlog::logger>(component, base->sinks().begin(), base->sinks().end());
        logger->set_level(spdlog::get_level());
        spdlog::register_logger(logger);
        return logger;
    }

} // namespace ari::logging
