#pragma once

#include <flowcap/schema/flow_counter_state.hpp>
#include <flowcap/schema/flow_direction.hpp>
#include <flowcap/schema/flow_result.hpp>
#include <flowcap/schema/primitives.hpp>
#include <cstddef>
#include <map>
#include <mutex>

namespace flowcap::limiter {

/// Net-flow accounting for a single subject.
///
/// Counters are kept per epoch, where the epoch index is `now / epoch_length`.
/// A record call in one direction is admitted only while that direction's
/// counter stays within the opposing counter plus the limit. A zero limit
/// disables accounting entirely. All members are safe to call concurrently;
/// the check and the commit of a record call happen under one lock.
class flow_limit final {
 public:
  flow_limit(const flowcap::schema::subject_id_t& subject,
             const flowcap::schema::amount_t& limit,
             flowcap::schema::duration_milliseconds_t epoch_length);

  flow_limit(const flow_limit&) = delete;
  flow_limit& operator=(const flow_limit&) = delete;
  flow_limit(flow_limit&&) = delete;
  flow_limit& operator=(flow_limit&&) = delete;

  const flowcap::schema::subject_id_t& subject() const { return subject_; }
  flowcap::schema::duration_milliseconds_t epoch_length() const {
    return epoch_length_;
  }
  flowcap::schema::epoch_index_t epoch_of(
      flowcap::schema::timestamp_milliseconds_t now) const {
    return now / epoch_length_;
  }

  flowcap::schema::amount_t limit() const;

  /// Replace the limit and return the previous one. Recorded counters are
  /// left untouched.
  flowcap::schema::amount_t set_limit(const flowcap::schema::amount_t& limit);

  /// Check and commit `amount` in `direction` for the epoch containing
  /// `now`. On rejection nothing is mutated.
  flowcap::schema::flow_result_t record(
      flowcap::schema::flow_direction_t direction,
      const flowcap::schema::amount_t& amount,
      flowcap::schema::timestamp_milliseconds_t now);

  /// Counter for `direction` in the epoch containing `now`.
  flowcap::schema::amount_t flow(
      flowcap::schema::flow_direction_t direction,
      flowcap::schema::timestamp_milliseconds_t now) const;

  /// Largest amount a record call in `direction` would admit at `now`.
  flowcap::schema::amount_t available(
      flowcap::schema::flow_direction_t direction,
      flowcap::schema::timestamp_milliseconds_t now) const;

  flowcap::schema::flow_counter_state_t counters(
      flowcap::schema::timestamp_milliseconds_t now) const;

  /// Erase counters of epochs before `oldest_retained`.
  std::size_t prune(flowcap::schema::epoch_index_t oldest_retained);

  /// Number of epochs with live counter entries.
  std::size_t tracked_epochs() const;

 private:
  struct epoch_counters final {
    flowcap::schema::amount_t outflow;
    flowcap::schema::amount_t inflow;

    flowcap::schema::amount_t& get(flowcap::schema::flow_direction_t direction);
    const flowcap::schema::amount_t& get(
        flowcap::schema::flow_direction_t direction) const;
  };

  epoch_counters counters_at(flowcap::schema::epoch_index_t epoch) const;
  flowcap::schema::amount_t available_at(
      const epoch_counters& counters,
      flowcap::schema::flow_direction_t direction) const;

  mutable std::mutex mutex_;
  flowcap::schema::subject_id_t subject_;
  flowcap::schema::duration_milliseconds_t epoch_length_{};
  flowcap::schema::amount_t limit_;
  std::map<flowcap::schema::epoch_index_t, epoch_counters> counters_;
};

}  // namespace flowcap::limiter
