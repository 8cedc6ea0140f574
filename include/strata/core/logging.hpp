#pragma once

#include "strata/core/config.hpp"

namespace strata::core {

/**
 * @brief Apply level and pattern to the process-wide spdlog logger
 *
 * Unknown level names fall back to "info" with a warning.
 */
void configure_logging(const LoggingConfig& config);

} // namespace strata::core
