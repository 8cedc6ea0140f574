#include "strata/core/clock.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace strata {

std::string format_time(TimePoint tp) {
    const std::time_t raw = Clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&raw, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

} // namespace strata
