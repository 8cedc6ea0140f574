#include "strata/core/logging.hpp"

#include <spdlog/spdlog.h>

namespace strata::core {

void configure_logging(const LoggingConfig& config) {
    auto level = spdlog::level::from_str(config.level);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && config.level != "off") {
        spdlog::set_level(spdlog::level::info);
        spdlog::warn("Unknown log level '{}', using info", config.level);
    } else {
        spdlog::set_level(level);
    }
    spdlog::set_pattern(config.pattern);
}

} // namespace strata::core
