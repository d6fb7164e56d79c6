#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

void init_logging(const std::string& level) {
    auto logger = spdlog::get("gatewarden");
    if (!logger) {
        logger = spdlog::stderr_color_mt("gatewarden");
    }
    logger->set_pattern("%Y-%m-%dT%H:%M:%S%z %^%-5l%$ %v");
    spdlog::set_default_logger(logger);

    auto lvl = spdlog::level::from_str(level);
    // from_str maps unknown names to "off"
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
        spdlog::warn("Unknown log level '{}', using info", level);
    }
    spdlog::set_level(lvl);
    spdlog::flush_on(spdlog::level::warn);
}
