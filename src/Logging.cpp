#include "Logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace wsb {

void initLogging(const std::string& level) {
    auto logger = spdlog::get(kProcessTag);
    if (!logger) logger = spdlog::stdout_color_mt(kProcessTag);
    logger->set_pattern("[%n] %^%l%$: %v");
    auto lvl = spdlog::level::from_str(level);
    // from_str answers "off" for names it does not know.
    if (lvl == spdlog::level::off && level != "off") lvl = spdlog::level::info;
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::info);
    spdlog::set_default_logger(logger);
}

} // namespace wsb
