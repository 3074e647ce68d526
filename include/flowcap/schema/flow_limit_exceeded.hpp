#pragma once

#include <flowcap/schema/flow_direction.hpp>
#include <flowcap/schema/primitives.hpp>

namespace flowcap::schema {

template <uint16_t Version>
struct flow_limit_exceeded;

/// Payload of a rejected record call. `available` is the largest amount the
/// same call could have admitted at the time of rejection.
template <>
struct flow_limit_exceeded<1> final {
  uint16_t version{1};
  subject_id_t subject;
  flow_direction_t direction{flow_direction_t::outflow};
  amount_t attempted;
  amount_t available;
  amount_t limit;
  epoch_index_t epoch{};
};

using flow_limit_exceeded_t = flow_limit_exceeded<1>;

}  // namespace flowcap::schema
