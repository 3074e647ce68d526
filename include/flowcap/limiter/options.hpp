#pragma once

#include <flowcap/schema/primitives.hpp>
#include <cstdint>

namespace flowcap::limiter {

/// Runtime options for a flow_limiter registry.
struct flow_limiter_options final {
  /// Length of one tumbling window. Applies to subjects registered without
  /// an explicit epoch length. Must be non-zero.
  flowcap::schema::duration_milliseconds_t epoch_length{
      flowcap::schema::kDefaultEpochLength};
  /// Number of past epochs whose counters survive pruning.
  uint64_t retained_epochs{1};
  /// Prune a subject's stale epochs after each committed record call.
  bool prune_on_record{true};
};

using flow_limiter_options_t = flow_limiter_options;

}  // namespace flowcap::limiter
