#pragma once

#include <flowcap/schema/primitives.hpp>

// Schema type: flow counter state.
// Flow accounting: point-in-time view of one subject's live epoch, read
// atomically under the subject lock.
namespace flowcap::schema {

template <uint16_t Version>
struct flow_counter_state;

template <>
struct flow_counter_state<1> final {
  uint16_t version{1};
  subject_id_t subject;
  epoch_index_t epoch{};
  duration_milliseconds_t epoch_length{};
  amount_t limit;
  amount_t outflow;
  amount_t inflow;
  amount_t available_outflow;
  amount_t available_inflow;
};

using flow_counter_state_t = flow_counter_state<1>;

}  // namespace flowcap::schema
