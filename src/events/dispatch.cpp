#include "strata/events/dispatch.hpp"

#include <variant>

namespace strata::events {

void dispatch(EventBus& bus, const domain::DomainEvents& events) {
    for (const auto& event : events) {
        std::visit([&bus](const auto& concrete) { bus.emit(concrete); }, event);
    }
}

} // namespace strata::events
