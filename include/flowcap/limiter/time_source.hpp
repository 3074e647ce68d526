#pragma once

#include <flowcap/schema/primitives.hpp>
#include <functional>

namespace flowcap::limiter {

/// Returns the current wall-clock time in milliseconds since the Unix epoch.
using time_source_t = std::function<flowcap::schema::timestamp_milliseconds_t()>;

time_source_t system_time_source();

}  // namespace flowcap::limiter
