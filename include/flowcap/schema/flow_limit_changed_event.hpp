#pragma once

#include <flowcap/schema/primitives.hpp>

// Schema type: flow limit changed event.
// Flow accounting: audit record handed to the event sink on every limit
// update, including updates that keep the same value.
namespace flowcap::schema {

template <uint16_t Version>
struct flow_limit_changed_event;

template <>
struct flow_limit_changed_event<1> final {
  uint16_t version{1};
  subject_id_t subject;
  actor_id_t actor;
  amount_t previous_limit;
  amount_t new_limit;
  epoch_index_t epoch{};
  timestamp_milliseconds_t recorded_at{};
};

using flow_limit_changed_event_t = flow_limit_changed_event<1>;

}  // namespace flowcap::schema
