#pragma once

#include <flowcap/limiter/flow_limit.hpp>
#include <flowcap/limiter/limit_changed_sink.hpp>
#include <flowcap/limiter/options.hpp>
#include <flowcap/limiter/time_source.hpp>
#include <flowcap/schema/flow_counter_state.hpp>
#include <flowcap/schema/flow_limit_changed_event.hpp>
#include <flowcap/schema/flow_result.hpp>
#include <flowcap/schema/primitives.hpp>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace flowcap::limiter {

/// Registry of per-subject net-flow limits sharing one clock and one audit
/// sink.
///
/// Callers authorize limit updates before calling in; the actor passed to
/// `set_limit` is only forwarded to the sink. Record calls are pre-commit
/// checks: a failed result means the enclosing transfer must be aborted.
/// Subjects that were never registered behave as registered subjects with
/// a zero (disabled) limit.
class flow_limiter final {
 public:
  explicit flow_limiter(flow_limiter_options_t options = {},
                        time_source_t time_source = system_time_source(),
                        limit_changed_sink_t limit_changed_sink = {});

  flow_limiter(const flow_limiter&) = delete;
  flow_limiter& operator=(const flow_limiter&) = delete;

  /// Register `subject` with an initial limit and, optionally, its own epoch
  /// length. Returns false and leaves the existing state alone when the
  /// subject is already registered.
  bool register_subject(
      const flowcap::schema::subject_id_t& subject,
      const flowcap::schema::amount_t& initial_limit = {},
      std::optional<flowcap::schema::duration_milliseconds_t> epoch_length =
          std::nullopt);

  bool contains(const flowcap::schema::subject_id_t& subject) const;
  std::vector<flowcap::schema::subject_id_t> subjects() const;

  /// Replace the limit of `subject`, registering it when unknown, and notify
  /// the sink.
  void set_limit(const flowcap::schema::subject_id_t& subject,
                 const flowcap::schema::amount_t& limit,
                 const flowcap::schema::actor_id_t& actor);

  /// Apply `limits[i]` to `subjects[i]` for every i.
  ///
  /// Nothing is applied when the two lists differ in length. The batch is
  /// applied under the registry lock, so record calls and queries issued
  /// after it starts observe either none or all of it. A record call that
  /// already looked up its subject may still finish against the previous
  /// limit.
  flowcap::schema::flow_result_t set_limits(
      const std::vector<flowcap::schema::subject_id_t>& subjects,
      const std::vector<flowcap::schema::amount_t>& limits,
      const flowcap::schema::actor_id_t& actor);

  /// Account `amount` leaving the system for `subject` in the current epoch.
  ///
  /// Admitted when outflow after the call stays within inflow plus the
  /// limit. A rejected call changes nothing and carries a
  /// `flow_limit_exceeded` payload. Always admitted, without accounting,
  /// when the limit is zero or the subject is unknown.
  flowcap::schema::flow_result_t record_outflow(
      const flowcap::schema::subject_id_t& subject,
      const flowcap::schema::amount_t& amount);

  /// Account `amount` entering the system for `subject` in the current epoch.
  ///
  /// Mirror of `record_outflow`: inflow is checked against outflow plus the
  /// limit.
  flowcap::schema::flow_result_t record_inflow(
      const flowcap::schema::subject_id_t& subject,
      const flowcap::schema::amount_t& amount);

  /// Configured limit of `subject`; zero when disabled or unknown.
  flowcap::schema::amount_t current_limit(
      const flowcap::schema::subject_id_t& subject) const;

  /// Outflow admitted for `subject` in the current epoch.
  ///
  /// Reads zero once the clock enters an epoch with no recorded flow, even
  /// before older counters are pruned.
  flowcap::schema::amount_t current_outflow(
      const flowcap::schema::subject_id_t& subject) const;

  /// Inflow admitted for `subject` in the current epoch.
  flowcap::schema::amount_t current_inflow(
      const flowcap::schema::subject_id_t& subject) const;

  /// Largest amount the next record call in that direction would admit.
  flowcap::schema::amount_t available_outflow(
      const flowcap::schema::subject_id_t& subject) const;
  flowcap::schema::amount_t available_inflow(
      const flowcap::schema::subject_id_t& subject) const;

  flowcap::schema::flow_counter_state_t counters(
      const flowcap::schema::subject_id_t& subject) const;

  /// Epoch helpers for the registry-wide epoch length. `epoch_start`
  /// saturates at the largest timestamp for epochs that begin past it.
  flowcap::schema::epoch_index_t epoch_of(
      flowcap::schema::timestamp_milliseconds_t time) const;
  flowcap::schema::epoch_index_t current_epoch() const;
  flowcap::schema::timestamp_milliseconds_t epoch_start(
      flowcap::schema::epoch_index_t epoch) const;

  /// Drop counters older than `retained_epochs` before each subject's
  /// current epoch. Returns the number of epoch entries removed.
  std::size_t prune_stale_epochs();

  void set_limit_changed_sink(limit_changed_sink_t sink);

  const flow_limiter_options_t& options() const { return options_; }

 private:
  flowcap::schema::flow_result_t record(
      flowcap::schema::flow_direction_t direction,
      const flowcap::schema::subject_id_t& subject,
      const flowcap::schema::amount_t& amount);

  /// Entry for `subject` or nullptr. Entries are never erased, so the
  /// pointer stays valid for the registry's lifetime.
  flow_limit* find(const flowcap::schema::subject_id_t& subject) const;
  flow_limit& find_or_register(const flowcap::schema::subject_id_t& subject);
  /// Requires `mutex_` to be held.
  flow_limit& find_or_register_locked(
      const flowcap::schema::subject_id_t& subject);

  /// Apply a limit and return the event to publish once locks are released.
  flowcap::schema::flow_limit_changed_event_t apply_limit(
      flow_limit& entry,
      const flowcap::schema::amount_t& limit,
      const flowcap::schema::actor_id_t& actor,
      flowcap::schema::timestamp_milliseconds_t now);
  void publish(const std::vector<flowcap::schema::flow_limit_changed_event_t>&
                   events) const;

  flowcap::schema::epoch_index_t oldest_retained(
      flowcap::schema::epoch_index_t current) const;

  mutable std::mutex mutex_;
  flow_limiter_options_t options_;
  time_source_t time_source_;
  limit_changed_sink_t limit_changed_sink_;
  std::map<flowcap::schema::subject_id_t, std::unique_ptr<flow_limit>>
      subjects_;
};

}  // namespace flowcap::limiter
