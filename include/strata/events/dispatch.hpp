#pragma once

#include "strata/domain/domain_events.hpp"
#include "strata/events/event_bus.hpp"

namespace strata::events {

/// Emits each domain event as its concrete type, in order
void dispatch(EventBus& bus, const domain::DomainEvents& events);

} // namespace strata::events
