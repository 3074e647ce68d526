#include <spdlog/async.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <flowcap/common/critical.hpp>
#include <flowcap/schema/primitives.hpp>
#include <flowcap/tools/replay.hpp>

#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

namespace {

namespace po = boost::program_options;

void install_logger(const std::string& level) {
  spdlog::init_thread_pool(8192, 1);
  auto stderr_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto logger = std::make_shared<spdlog::async_logger>(
      "replay", spdlog::sinks_init_list{stderr_sink}, spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto parsed = spdlog::level::from_str(level);
  if (parsed == spdlog::level::off && level != "off") {
    flowcap::common::critical("unknown log level '{}'", level);
  }
  spdlog::set_level(parsed);
}

flowcap::schema::actor_id_t parse_actor(const std::string& value) {
  if (auto hash = flowcap::schema::try_make_hash32(value)) {
    return *hash;
  }
  if (auto label = flowcap::schema::try_make_label_hash(value)) {
    return *label;
  }
  flowcap::common::critical("invalid actor '{}'", value);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto input_path = std::string{};
  auto log_level = std::string{};
  auto actor = std::string{};
  auto options = flowcap::tools::replay_options{};

  auto description = po::options_description{"flowcap_replay"};
  description.add_options()("help,h", "Show the help message")(
      "input,i", po::value<std::string>(&input_path)->default_value("-"),
      "script path, '-' reads stdin")(
      "epoch-length-ms",
      po::value<uint64_t>(&options.limiter.epoch_length)
          ->default_value(flowcap::schema::kDefaultEpochLength),
      "default epoch length in milliseconds")(
      "retained-epochs",
      po::value<uint64_t>(&options.limiter.retained_epochs)->default_value(1),
      "past epochs kept by pruning")(
      "prune-on-record",
      po::value<bool>(&options.limiter.prune_on_record)->default_value(true),
      "prune stale epochs after each admitted record")(
      "start-ms", po::value<uint64_t>(&options.start_time)->default_value(0),
      "initial clock value in milliseconds")(
      "actor", po::value<std::string>(&actor)->default_value("replay"),
      "actor reported for limit updates (hash32 hex or label)")(
      "fail-on-reject", "exit with status 1 when any record is rejected")(
      "log-level,l", po::value<std::string>(&log_level)->default_value("warn"),
      "trace|debug|info|warn|error|critical|off");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  install_logger(log_level);
  if (options.limiter.epoch_length == 0) {
    flowcap::common::critical("--epoch-length-ms must be positive");
  }
  options.actor = parse_actor(actor);

  auto file = std::ifstream{};
  if (input_path != "-") {
    file.open(input_path);
    if (!file) {
      flowcap::common::critical("cannot open script '{}'", input_path);
    }
  }
  auto& input = input_path == "-" ? std::cin : static_cast<std::istream&>(file);

  auto summary = flowcap::tools::run_replay(input, std::cout, options);
  std::cout.flush();
  if (summary.error) {
    flowcap::common::critical("line {}: {}", summary.error_line,
                              *summary.error);
  }

  spdlog::info("Replay finished: {} command(s), {} admitted, {} rejected",
               summary.commands, summary.admitted, summary.rejected);
  spdlog::shutdown();
  if (vm.contains("fail-on-reject") && summary.rejected > 0) {
    return 1;
  }
  return 0;
}
