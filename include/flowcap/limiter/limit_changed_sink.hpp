#pragma once

#include <flowcap/schema/flow_limit_changed_event.hpp>
#include <functional>

namespace flowcap::limiter {

/// Receives every limit update for audit. Invoked outside of limiter locks.
using limit_changed_sink_t =
    std::function<void(const flowcap::schema::flow_limit_changed_event_t&)>;

}  // namespace flowcap::limiter
