#include <spdlog/spdlog.h>
#include <flowcap/common/critical.hpp>
#include <flowcap/limiter/flow_limiter.hpp>
#include <iterator>
#include <limits>
#include <utility>

using namespace flowcap::schema;

namespace flowcap::limiter {

flow_limiter::flow_limiter(flow_limiter_options_t options,
                           time_source_t time_source,
                           limit_changed_sink_t limit_changed_sink)
    : options_{options},
      time_source_{std::move(time_source)},
      limit_changed_sink_{std::move(limit_changed_sink)} {
  if (options_.epoch_length == 0) {
    flowcap::common::critical("Flow limiter epoch length must be positive");
  }
  if (!time_source_) {
    flowcap::common::critical("Flow limiter requires a time source");
  }
  spdlog::info(
      "Flow limiter ready with epoch length {} ms, retaining {} past "
      "epoch(s)",
      options_.epoch_length, options_.retained_epochs);
}

bool flow_limiter::register_subject(
    const subject_id_t& subject,
    const amount_t& initial_limit,
    std::optional<duration_milliseconds_t> epoch_length) {
  auto lock = std::scoped_lock{mutex_};
  if (subjects_.contains(subject)) {
    spdlog::debug("Subject {} already registered", to_hex(subject));
    return false;
  }
  auto length = epoch_length.value_or(options_.epoch_length);
  subjects_.emplace(subject,
                    std::make_unique<flow_limit>(subject, initial_limit, length));
  spdlog::info("Registered subject {} with limit {} and epoch length {} ms",
               to_hex(subject), to_string(initial_limit), length);
  return true;
}

bool flow_limiter::contains(const subject_id_t& subject) const {
  return find(subject) != nullptr;
}

std::vector<subject_id_t> flow_limiter::subjects() const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<subject_id_t>{};
  out.reserve(subjects_.size());
  for (const auto& [subject, entry] : subjects_) {
    out.push_back(subject);
  }
  return out;
}

void flow_limiter::set_limit(const subject_id_t& subject,
                             const amount_t& limit,
                             const actor_id_t& actor) {
  auto& entry = find_or_register(subject);
  auto event = apply_limit(entry, limit, actor, time_source_());
  publish({event});
}

flow_result_t flow_limiter::set_limits(const std::vector<subject_id_t>& subjects,
                                       const std::vector<amount_t>& limits,
                                       const actor_id_t& actor) {
  auto result = flow_result_t{};
  if (subjects.size() != limits.size()) {
    result.code = flow_error_code::length_mismatch;
    result.codespace = "flowcap.limiter";
    result.log = "subject and limit lists differ in length";
    spdlog::warn("Rejected batch limit update: {} subject(s), {} limit(s)",
                 subjects.size(), limits.size());
    return result;
  }

  const auto now = time_source_();
  auto events = std::vector<flow_limit_changed_event_t>{};
  events.reserve(subjects.size());
  {
    auto lock = std::scoped_lock{mutex_};
    for (std::size_t i = 0; i < subjects.size(); ++i) {
      events.push_back(apply_limit(find_or_register_locked(subjects[i]),
                                   limits[i], actor, now));
    }
  }
  publish(events);
  return result;
}

flow_result_t flow_limiter::record_outflow(const subject_id_t& subject,
                                           const amount_t& amount) {
  return record(flow_direction_t::outflow, subject, amount);
}

flow_result_t flow_limiter::record_inflow(const subject_id_t& subject,
                                          const amount_t& amount) {
  return record(flow_direction_t::inflow, subject, amount);
}

amount_t flow_limiter::current_limit(const subject_id_t& subject) const {
  auto* entry = find(subject);
  return entry == nullptr ? amount_t{} : entry->limit();
}

amount_t flow_limiter::current_outflow(const subject_id_t& subject) const {
  auto* entry = find(subject);
  if (entry == nullptr) {
    return {};
  }
  return entry->flow(flow_direction_t::outflow, time_source_());
}

amount_t flow_limiter::current_inflow(const subject_id_t& subject) const {
  auto* entry = find(subject);
  if (entry == nullptr) {
    return {};
  }
  return entry->flow(flow_direction_t::inflow, time_source_());
}

amount_t flow_limiter::available_outflow(const subject_id_t& subject) const {
  auto* entry = find(subject);
  if (entry == nullptr) {
    return max_amount();
  }
  return entry->available(flow_direction_t::outflow, time_source_());
}

amount_t flow_limiter::available_inflow(const subject_id_t& subject) const {
  auto* entry = find(subject);
  if (entry == nullptr) {
    return max_amount();
  }
  return entry->available(flow_direction_t::inflow, time_source_());
}

flow_counter_state_t flow_limiter::counters(const subject_id_t& subject) const {
  const auto now = time_source_();
  auto* entry = find(subject);
  if (entry != nullptr) {
    return entry->counters(now);
  }
  return flow_counter_state_t{.subject = subject,
                              .epoch = epoch_of(now),
                              .epoch_length = options_.epoch_length,
                              .limit = {},
                              .outflow = {},
                              .inflow = {},
                              .available_outflow = max_amount(),
                              .available_inflow = max_amount()};
}

epoch_index_t flow_limiter::epoch_of(const timestamp_milliseconds_t time) const {
  return time / options_.epoch_length;
}

epoch_index_t flow_limiter::current_epoch() const {
  return epoch_of(time_source_());
}

timestamp_milliseconds_t flow_limiter::epoch_start(
    const epoch_index_t epoch) const {
  constexpr auto kLatest = std::numeric_limits<timestamp_milliseconds_t>::max();
  if (epoch > kLatest / options_.epoch_length) {
    return kLatest;
  }
  return epoch * options_.epoch_length;
}

std::size_t flow_limiter::prune_stale_epochs() {
  auto entries = std::vector<flow_limit*>{};
  {
    auto lock = std::scoped_lock{mutex_};
    entries.reserve(subjects_.size());
    for (const auto& [subject, entry] : subjects_) {
      entries.push_back(entry.get());
    }
  }

  const auto now = time_source_();
  auto removed = std::size_t{0};
  for (auto* entry : entries) {
    removed += entry->prune(oldest_retained(entry->epoch_of(now)));
  }
  if (removed > 0) {
    spdlog::info("Pruned {} stale epoch counter(s) across {} subject(s)",
                 removed, entries.size());
  }
  return removed;
}

void flow_limiter::set_limit_changed_sink(limit_changed_sink_t sink) {
  auto lock = std::scoped_lock{mutex_};
  limit_changed_sink_ = std::move(sink);
}

flow_result_t flow_limiter::record(const flow_direction_t direction,
                                   const subject_id_t& subject,
                                   const amount_t& amount) {
  auto* entry = find(subject);
  if (entry == nullptr) {
    return flow_result_t{};
  }

  const auto now = time_source_();
  auto result = entry->record(direction, amount, now);
  if (result.ok() && options_.prune_on_record) {
    entry->prune(oldest_retained(entry->epoch_of(now)));
  }
  return result;
}

flow_limit* flow_limiter::find(const subject_id_t& subject) const {
  auto lock = std::scoped_lock{mutex_};
  auto existing = subjects_.find(subject);
  if (existing == std::end(subjects_)) {
    return nullptr;
  }
  return existing->second.get();
}

flow_limit& flow_limiter::find_or_register(const subject_id_t& subject) {
  auto lock = std::scoped_lock{mutex_};
  return find_or_register_locked(subject);
}

flow_limit& flow_limiter::find_or_register_locked(const subject_id_t& subject) {
  auto existing = subjects_.find(subject);
  if (existing != std::end(subjects_)) {
    return *existing->second;
  }
  auto inserted =
      subjects_
          .emplace(subject, std::make_unique<flow_limit>(
                                subject, amount_t{}, options_.epoch_length))
          .first;
  spdlog::info("Registered subject {} on first limit update", to_hex(subject));
  return *inserted->second;
}

flow_limit_changed_event_t flow_limiter::apply_limit(
    flow_limit& entry,
    const amount_t& limit,
    const actor_id_t& actor,
    const timestamp_milliseconds_t now) {
  auto previous = entry.set_limit(limit);
  spdlog::info("Flow limit for subject {} set to {} by {} (was {})",
               to_hex(entry.subject()), to_string(limit), to_hex(actor),
               to_string(previous));
  return flow_limit_changed_event_t{.subject = entry.subject(),
                                    .actor = actor,
                                    .previous_limit = previous,
                                    .new_limit = limit,
                                    .epoch = entry.epoch_of(now),
                                    .recorded_at = now};
}

void flow_limiter::publish(
    const std::vector<flow_limit_changed_event_t>& events) const {
  auto sink = limit_changed_sink_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    sink = limit_changed_sink_;
  }
  if (!sink) {
    return;
  }
  for (const auto& event : events) {
    sink(event);
  }
}

epoch_index_t flow_limiter::oldest_retained(const epoch_index_t current) const {
  return current > options_.retained_epochs
             ? current - options_.retained_epochs
             : epoch_index_t{0};
}

}  // namespace flowcap::limiter
