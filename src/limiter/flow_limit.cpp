#include <spdlog/spdlog.h>
#include <flowcap/common/critical.hpp>
#include <flowcap/limiter/flow_limit.hpp>
#include <iterator>

using namespace flowcap::schema;

namespace {

// `opposing + limit - used`, with the ceiling saturated at the largest
// amount and the result floored at zero. Once a limit is lowered the used
// counter may already sit above the ceiling.
amount_t headroom(const amount_t& used,
                  const amount_t& opposing,
                  const amount_t& limit) {
  const auto& max = max_amount();
  auto ceiling = opposing > (max - limit) ? max : opposing + limit;
  if (used >= ceiling) {
    return amount_t{};
  }
  return ceiling - used;
}

}  // namespace

namespace flowcap::limiter {

amount_t& flow_limit::epoch_counters::get(const flow_direction_t direction) {
  return direction == flow_direction_t::outflow ? outflow : inflow;
}

const amount_t& flow_limit::epoch_counters::get(
    const flow_direction_t direction) const {
  return direction == flow_direction_t::outflow ? outflow : inflow;
}

flow_limit::flow_limit(const subject_id_t& subject,
                       const amount_t& limit,
                       const duration_milliseconds_t epoch_length)
    : subject_{subject}, epoch_length_{epoch_length}, limit_{limit} {
  if (epoch_length_ == 0) {
    flowcap::common::critical("Epoch length for subject {} must be positive",
                              to_hex(subject_));
  }
}

amount_t flow_limit::limit() const {
  auto lock = std::scoped_lock{mutex_};
  return limit_;
}

amount_t flow_limit::set_limit(const amount_t& limit) {
  auto lock = std::scoped_lock{mutex_};
  auto previous = limit_;
  limit_ = limit;
  return previous;
}

flow_result_t flow_limit::record(const flow_direction_t direction,
                                 const amount_t& amount,
                                 const timestamp_milliseconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto result = flow_result_t{};
  if (limit_ == 0 || amount == 0) {
    return result;
  }

  const auto epoch = epoch_of(now);
  const auto current = counters_at(epoch);
  auto available = available_at(current, direction);
  if (amount > available) {
    result.code = flow_error_code::flow_limit_exceeded;
    result.codespace = "flowcap.limiter";
    result.log = "flow limit exceeded";
    result.exceeded = flow_limit_exceeded_t{.subject = subject_,
                                            .direction = direction,
                                            .attempted = amount,
                                            .available = available,
                                            .limit = limit_,
                                            .epoch = epoch};
    spdlog::warn(
        "Rejected {} of {} for subject {} in epoch {}: {} available under "
        "limit {}",
        to_string(direction), to_string(amount), to_hex(subject_), epoch,
        to_string(available), to_string(limit_));
    return result;
  }

  auto& counters = counters_[epoch];
  counters.get(direction) += amount;
  spdlog::debug("Recorded {} of {} for subject {} in epoch {} (out={}, in={})",
                to_string(direction), to_string(amount), to_hex(subject_),
                epoch, to_string(counters.outflow), to_string(counters.inflow));
  return result;
}

amount_t flow_limit::flow(const flow_direction_t direction,
                          const timestamp_milliseconds_t now) const {
  auto lock = std::scoped_lock{mutex_};
  return counters_at(epoch_of(now)).get(direction);
}

amount_t flow_limit::available(const flow_direction_t direction,
                               const timestamp_milliseconds_t now) const {
  auto lock = std::scoped_lock{mutex_};
  return available_at(counters_at(epoch_of(now)), direction);
}

flow_counter_state_t flow_limit::counters(
    const timestamp_milliseconds_t now) const {
  auto lock = std::scoped_lock{mutex_};
  const auto epoch = epoch_of(now);
  const auto current = counters_at(epoch);
  return flow_counter_state_t{
      .subject = subject_,
      .epoch = epoch,
      .epoch_length = epoch_length_,
      .limit = limit_,
      .outflow = current.outflow,
      .inflow = current.inflow,
      .available_outflow = available_at(current, flow_direction_t::outflow),
      .available_inflow = available_at(current, flow_direction_t::inflow)};
}

std::size_t flow_limit::prune(const epoch_index_t oldest_retained) {
  auto lock = std::scoped_lock{mutex_};
  auto first_kept = counters_.lower_bound(oldest_retained);
  auto removed = static_cast<std::size_t>(
      std::distance(std::begin(counters_), first_kept));
  counters_.erase(std::begin(counters_), first_kept);
  return removed;
}

std::size_t flow_limit::tracked_epochs() const {
  auto lock = std::scoped_lock{mutex_};
  return counters_.size();
}

flow_limit::epoch_counters flow_limit::counters_at(
    const epoch_index_t epoch) const {
  auto existing = counters_.find(epoch);
  if (existing == std::end(counters_)) {
    return epoch_counters{};
  }
  return existing->second;
}

amount_t flow_limit::available_at(const epoch_counters& counters,
                                  const flow_direction_t direction) const {
  if (limit_ == 0) {
    return max_amount();
  }
  return headroom(counters.get(direction), counters.get(opposite(direction)),
                  limit_);
}

}  // namespace flowcap::limiter
