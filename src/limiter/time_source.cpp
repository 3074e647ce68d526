#include <flowcap/limiter/time_source.hpp>

#include <chrono>

namespace flowcap::limiter {

time_source_t system_time_source() {
  return [] {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<flowcap::schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
  };
}

}  // namespace flowcap::limiter
