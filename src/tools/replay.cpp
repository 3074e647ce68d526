#include <spdlog/spdlog.h>
#include <flowcap/limiter/flow_limiter.hpp>
#include <flowcap/schema/flow_direction.hpp>
#include <flowcap/tools/replay.hpp>

#include <istream>
#include <limits>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace flowcap::schema;

namespace {

std::vector<std::string> tokenize(const std::string& line) {
  auto content = std::string_view{line};
  if (auto comment = content.find('#'); comment != std::string_view::npos) {
    content = content.substr(0, comment);
  }
  auto stream = std::istringstream{std::string{content}};
  auto tokens = std::vector<std::string>{};
  for (auto token = std::string{}; stream >> token;) {
    tokens.push_back(std::move(token));
  }
  return tokens;
}

std::optional<subject_id_t> parse_subject(const std::string& token) {
  if (auto hash = try_make_hash32(token)) {
    return hash;
  }
  return try_make_label_hash(token);
}

std::optional<uint64_t> parse_u64(const std::string& token) {
  auto amount = try_make_amount(token);
  if (!amount || *amount > std::numeric_limits<uint64_t>::max()) {
    return std::nullopt;
  }
  return amount->convert_to<uint64_t>();
}

class replay_session final {
 public:
  replay_session(std::ostream& output, const flowcap::tools::replay_options& options)
      : output_{output},
        now_{options.start_time},
        actor_{options.actor},
        limiter_{options.limiter, [this] { return now_; }} {}

  /// Execute one tokenized command. Returns an error description when the
  /// command is malformed.
  std::optional<std::string> execute(const std::vector<std::string>& tokens,
                                     flowcap::tools::replay_summary& summary) {
    const auto& command = tokens.front();
    if (command == "at" || command == "advance") {
      if (tokens.size() != 2) {
        return command + " expects one time argument";
      }
      auto value = parse_u64(tokens[1]);
      if (!value) {
        return "invalid time '" + tokens[1] + "'";
      }
      if (command == "advance" &&
          *value > std::numeric_limits<timestamp_milliseconds_t>::max() - now_) {
        return "time overflow";
      }
      auto target = command == "at" ? *value : now_ + *value;
      if (target < now_) {
        return "time must not go backwards";
      }
      now_ = target;
      print_time();
      return std::nullopt;
    }
    if (command == "next-epoch") {
      if (tokens.size() != 1) {
        return "next-epoch takes no arguments";
      }
      auto epoch = limiter_.current_epoch();
      if (epoch >= std::numeric_limits<timestamp_milliseconds_t>::max() /
                       limiter_.options().epoch_length) {
        return "time overflow";
      }
      now_ = limiter_.epoch_start(epoch + 1);
      print_time();
      return std::nullopt;
    }
    if (command == "register") {
      if (tokens.size() != 3 && tokens.size() != 4) {
        return "register expects <subject> <limit> [epoch-ms]";
      }
      auto subject = parse_subject(tokens[1]);
      auto limit = try_make_amount(tokens[2]);
      if (!subject || !limit) {
        return "invalid register arguments";
      }
      auto epoch_length = std::optional<duration_milliseconds_t>{};
      if (tokens.size() == 4) {
        epoch_length = parse_u64(tokens[3]);
        if (!epoch_length || *epoch_length == 0) {
          return "invalid epoch length '" + tokens[3] + "'";
        }
      }
      auto created = limiter_.register_subject(*subject, *limit, epoch_length);
      output_ << (created ? "registered " : "exists ") << tokens[1] << ' '
              << to_string(limiter_.current_limit(*subject)) << '\n';
      return std::nullopt;
    }
    if (command == "limit") {
      if (tokens.size() != 3) {
        return "limit expects <subject> <limit>";
      }
      auto subject = parse_subject(tokens[1]);
      auto limit = try_make_amount(tokens[2]);
      if (!subject || !limit) {
        return "invalid limit arguments";
      }
      limiter_.set_limit(*subject, *limit, actor_);
      ++summary.limit_updates;
      output_ << "limit " << tokens[1] << ' ' << to_string(*limit) << '\n';
      return std::nullopt;
    }
    if (auto direction = try_from_string<flow_direction_t>(command)) {
      if (tokens.size() != 3) {
        return command + " expects <subject> <amount>";
      }
      auto subject = parse_subject(tokens[1]);
      auto amount = try_make_amount(tokens[2]);
      if (!subject || !amount) {
        return "invalid " + command + " arguments";
      }
      auto result = *direction == flow_direction_t::outflow
                        ? limiter_.record_outflow(*subject, *amount)
                        : limiter_.record_inflow(*subject, *amount);
      if (result.ok()) {
        ++summary.admitted;
        output_ << "ok " << command << ' ' << tokens[1] << ' '
                << to_string(*amount) << '\n';
      } else {
        ++summary.rejected;
        output_ << "rejected " << command << ' ' << tokens[1] << ' '
                << to_string(*amount) << " available="
                << to_string(result.exceeded->available)
                << " limit=" << to_string(result.exceeded->limit)
                << " epoch=" << result.exceeded->epoch << '\n';
      }
      return std::nullopt;
    }
    if (command == "show") {
      if (tokens.size() != 2) {
        return "show expects <subject>";
      }
      auto subject = parse_subject(tokens[1]);
      if (!subject) {
        return "invalid subject '" + tokens[1] + "'";
      }
      auto state = limiter_.counters(*subject);
      output_ << tokens[1] << " epoch=" << state.epoch
              << " limit=" << to_string(state.limit)
              << " out=" << to_string(state.outflow)
              << " in=" << to_string(state.inflow)
              << " available_out=" << to_string(state.available_outflow)
              << " available_in=" << to_string(state.available_inflow) << '\n';
      return std::nullopt;
    }
    if (command == "prune") {
      if (tokens.size() != 1) {
        return "prune takes no arguments";
      }
      output_ << "pruned " << limiter_.prune_stale_epochs() << '\n';
      return std::nullopt;
    }
    return "unknown command '" + command + "'";
  }

 private:
  void print_time() {
    output_ << "time " << now_ << " epoch " << limiter_.current_epoch()
            << '\n';
  }

  std::ostream& output_;
  timestamp_milliseconds_t now_{};
  actor_id_t actor_;
  flowcap::limiter::flow_limiter limiter_;
};

}  // namespace

namespace flowcap::tools {

replay_summary run_replay(std::istream& input,
                          std::ostream& output,
                          const replay_options& options) {
  auto summary = replay_summary{};
  auto session = replay_session{output, options};

  auto line_number = uint64_t{0};
  for (auto line = std::string{}; std::getline(input, line);) {
    ++line_number;
    auto tokens = tokenize(line);
    if (tokens.empty()) {
      continue;
    }
    ++summary.commands;
    if (auto error = session.execute(tokens, summary)) {
      spdlog::error("Replay failed at line {}: {}", line_number, *error);
      summary.error = std::move(error);
      summary.error_line = line_number;
      break;
    }
  }

  spdlog::debug("Replayed {} command(s): {} admitted, {} rejected",
                summary.commands, summary.admitted, summary.rejected);
  return summary;
}

}  // namespace flowcap::tools
