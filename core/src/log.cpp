#include "log.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

void init_logging(const std::string& level) {
    std::string lvl = level.empty() ? getenv_or("RAGDESK_LOG_LEVEL", "info") : level;
    auto logger = spdlog::get("ragdesk");
    if (!logger) logger = spdlog::stderr_color_mt("ragdesk");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [ragdesk] [%l] %v");
    auto parsed = spdlog::level::from_str(lvl);
    if (parsed == spdlog::level::off && lvl != "off") {
        spdlog::warn("unknown log level '{}', using info", lvl);
        parsed = spdlog::level::info;
    }
    spdlog::set_level(parsed);
}
