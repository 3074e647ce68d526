#pragma once

#include <flowcap/limiter/flow_limiter.hpp>
#include <flowcap/limiter/limit_changed_sink.hpp>
#include <flowcap/limiter/time_source.hpp>
#include <flowcap/schema/flow_limit_changed_event.hpp>
#include <flowcap/schema/primitives.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace flowcap::testing {

inline constexpr auto kSixHours =
    flowcap::schema::duration_milliseconds_t{6 * 60 * 60 * 1000};

inline flowcap::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = flowcap::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline flowcap::schema::amount_t amount(const uint64_t value) {
  return flowcap::schema::amount_t{value};
}

/// Clock under test control. Copies of the time source share the value.
class manual_clock final {
 public:
  explicit manual_clock(const flowcap::schema::timestamp_milliseconds_t start = 0)
      : now_{std::make_shared<std::atomic<uint64_t>>(start)} {}

  flowcap::schema::timestamp_milliseconds_t now() const { return now_->load(); }
  void set(const flowcap::schema::timestamp_milliseconds_t value) {
    now_->store(value);
  }
  void advance(const flowcap::schema::duration_milliseconds_t delta) {
    now_->fetch_add(delta);
  }

  flowcap::limiter::time_source_t source() const {
    return [now = now_] { return now->load(); };
  }

 private:
  std::shared_ptr<std::atomic<uint64_t>> now_;
};

/// Sink that keeps every limit change it receives.
class recording_sink final {
 public:
  flowcap::limiter::limit_changed_sink_t sink() {
    return [this](const flowcap::schema::flow_limit_changed_event_t& event) {
      auto lock = std::scoped_lock{mutex_};
      events_.push_back(event);
    };
  }

  std::vector<flowcap::schema::flow_limit_changed_event_t> events() const {
    auto lock = std::scoped_lock{mutex_};
    return events_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<flowcap::schema::flow_limit_changed_event_t> events_;
};

inline flowcap::limiter::flow_limiter_options_t make_options(
    const flowcap::schema::duration_milliseconds_t epoch_length = kSixHours) {
  auto options = flowcap::limiter::flow_limiter_options_t{};
  options.epoch_length = epoch_length;
  return options;
}

}  // namespace flowcap::testing
