#pragma once

#include <flowcap/limiter/options.hpp>
#include <flowcap/schema/primitives.hpp>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>

namespace flowcap::tools {

/// Settings for replaying a flow script against a fresh limiter.
struct replay_options final {
  flowcap::limiter::flow_limiter_options_t limiter;
  flowcap::schema::timestamp_milliseconds_t start_time{};
  flowcap::schema::actor_id_t actor{};
};

struct replay_summary final {
  uint64_t commands{};
  uint64_t admitted{};
  uint64_t rejected{};
  uint64_t limit_updates{};
  /// Set when the script is malformed; replay stops at `error_line`.
  std::optional<std::string> error;
  uint64_t error_line{};
};

/// Execute a line-oriented flow script, writing one result line per command
/// to `output`.
///
/// Commands: `at <ms>`, `advance <ms>`, `next-epoch`,
/// `register <subject> <limit> [epoch-ms]`, `limit <subject> <limit>`,
/// `out <subject> <amount>`, `in <subject> <amount>`, `show <subject>`,
/// `prune`. Text after `#` is ignored. Subjects are 64 hex digits or a label
/// of at most 32 bytes.
replay_summary run_replay(std::istream& input,
                          std::ostream& output,
                          const replay_options& options);

}  // namespace flowcap::tools
