#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/program_options.hpp>
#include <charconv>
#include <chrono>
#include <floodgate/execution/engine.hpp>
#include <floodgate/registry/path_registry.hpp>
#include <floodgate/schema/encoding/scale/encoder.hpp>
#include <floodgate/schema/enum_string.hpp>
#include <floodgate/schema/transaction_error_code.hpp>
#include <floodgate/storage/memory/storage.hpp>
#include <floodgate/storage/rocksdb/storage.hpp>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace floodgate::schema;

namespace {

constexpr auto kInvalidUsage =
    static_cast<int>(transaction_error_code::invalid_transaction);

struct options final {
  std::string command;
  std::string backend;
  std::string db_path;
  std::string owner;
  std::string channel;
  std::string asset;
  std::string amount;
  std::string quota_name;
  std::vector<std::string> quotas;
  std::optional<timestamp_seconds_t> now;
};

std::optional<uint64_t> try_make_seconds(const std::string_view value) {
  auto out = uint64_t{};
  auto [end, error] =
      std::from_chars(value.data(), value.data() + value.size(), out);
  if (error != std::errc{} || end != value.data() + value.size()) {
    return std::nullopt;
  }
  return out;
}

/// Parse "name:duration:max_send:max_receive".
std::optional<quota_t> try_make_quota(const std::string_view value) {
  auto parts = std::vector<std::string>{};
  boost::algorithm::split(parts, std::string{value},
                          boost::algorithm::is_any_of(":"));
  if (parts.size() != 4 || parts[0].empty()) {
    return std::nullopt;
  }
  auto duration = try_make_seconds(parts[1]);
  auto max_send = try_make_amount(parts[2]);
  auto max_receive = try_make_amount(parts[3]);
  if (!duration || !max_send || !max_receive) {
    return std::nullopt;
  }
  return quota_t{.name = parts[0],
                 .max_send = *max_send,
                 .max_receive = *max_receive,
                 .duration = *duration};
}

timestamp_seconds_t wall_clock_seconds() {
  return static_cast<timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

void print_result(const transaction_result_t& result) {
  std::cout << "code=" << result.code << std::endl;
  if (!result.log.empty()) {
    std::cout << "log=" << result.log << std::endl;
  }
  for (const auto& event : result.events) {
    for (const auto& attribute : event.attributes) {
      std::cout << attribute.key << "=" << attribute.value << std::endl;
    }
  }
}

void print_limits(const rate_limits_t& limits) {
  for (const auto& limit : limits) {
    const auto& flow = limit.flow;
    std::cout << limit.quota.name << " inflow=" << to_string(flow.inflow)
              << " outflow=" << to_string(flow.outflow)
              << " max_send=" << to_string(limit.quota.max_send)
              << " max_receive=" << to_string(limit.quota.max_receive)
              << " period_end=" << flow.period_end << std::endl;
  }
}

std::optional<transaction_payload_t> make_payload(const options& opts) {
  auto path =
      path_t{.owner = opts.owner, .channel = opts.channel, .asset = opts.asset};
  if (opts.command == "register") {
    auto request = register_path_t{.path = path};
    for (const auto& text : opts.quotas) {
      auto quota = try_make_quota(text);
      if (!quota) {
        spdlog::error("Invalid quota '{}', expected "
                      "name:duration:max_send:max_receive",
                      text);
        return std::nullopt;
      }
      request.quotas.push_back(std::move(*quota));
    }
    return request;
  }
  if (opts.command == "deregister") {
    return deregister_path_t{.path = path};
  }
  if (opts.command == "reset") {
    if (opts.quota_name.empty()) {
      spdlog::error("reset requires --quota-name");
      return std::nullopt;
    }
    return reset_path_quota_t{.path = path, .quota_name = opts.quota_name};
  }

  auto amount = try_make_amount(opts.amount);
  if (!amount) {
    spdlog::error("{} requires a base-10 --amount, got '{}'", opts.command,
                  opts.amount);
    return std::nullopt;
  }
  if (opts.command == "undo") {
    return undo_send_t{.path = path, .amount = *amount};
  }
  auto direction = try_from_string<flow_direction_t>(opts.command);
  if (!direction) {
    spdlog::error("Unknown command '{}'", opts.command);
    return std::nullopt;
  }
  if (*direction == flow_direction_t::out) {
    return send_transfer_t{.path = path, .amount = *amount};
  }
  return receive_transfer_t{.path = path, .amount = *amount};
}

template <typename Library>
int run(const options& opts) {
  auto encoder = floodgate::registry::encoder_t{};
  auto storage = floodgate::storage::make_storage<Library>(opts.db_path);
  auto registry =
      floodgate::registry::path_registry<Library>{encoder, storage};
  auto engine = floodgate::execution::engine<Library>{registry};
  auto now = opts.now.value_or(wall_clock_seconds());

  if (opts.command == "list") {
    for (const auto& path : engine.list_paths()) {
      std::cout << path.owner << " " << path.channel << " " << path.asset
                << std::endl;
    }
    return 0;
  }
  if (opts.command == "query") {
    auto limits = engine.query_state(
        path_t{.owner = opts.owner, .channel = opts.channel, .asset = opts.asset});
    if (!limits) {
      std::cout << "unrestricted" << std::endl;
      return 0;
    }
    print_limits(*limits);
    return 0;
  }

  auto payload = make_payload(opts);
  if (!payload) {
    return kInvalidUsage;
  }
  auto result = engine.execute(transaction_t{.payload = std::move(*payload)},
                               now);
  print_result(result);
  return static_cast<int>(result.code);
}

}  // namespace

int main(int argc, char* argv[]) {
  auto opts = options{};
  auto config_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto now = uint64_t{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Floodgate"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "INI file with default option values")(
      "backend,b",
      boost::program_options::value<std::string>(&opts.backend)
          ->default_value("rocksdb"),
      "Storage backend: rocksdb or memory")(
      "db-path,d",
      boost::program_options::value<std::string>(&opts.db_path)
          ->default_value("floodgate.db"),
      "RocksDB directory")(
      "log-level,l",
      boost::program_options::value<std::string>(&log_level)
          ->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", boost::program_options::value<std::string>(&log_file),
      "Also write logs to this file")(
      "now", boost::program_options::value<uint64_t>(&now),
      "Current time in seconds, defaults to the wall clock")(
      "owner", boost::program_options::value<std::string>(&opts.owner),
      "Path owner")(
      "channel", boost::program_options::value<std::string>(&opts.channel),
      "Path channel")(
      "asset", boost::program_options::value<std::string>(&opts.asset),
      "Path asset")(
      "amount",
      boost::program_options::value<std::string>(&opts.amount),
      "Transfer amount (base 10)")(
      "quota,q",
      boost::program_options::value<std::vector<std::string>>(&opts.quotas)
          ->composing(),
      "name:duration:max_send:max_receive, repeatable")(
      "quota-name",
      boost::program_options::value<std::string>(&opts.quota_name),
      "Quota targeted by reset")(
      "command",
      boost::program_options::value<std::string>(&opts.command),
      "register | deregister | reset | send | receive | undo | query | list");

  auto positional = boost::program_options::positional_options_description{};
  positional.add("command", 1);

  try {
    boost::program_options::store(
        boost::program_options::command_line_parser(argc, argv)
            .options(description)
            .positional(positional)
            .run(),
        vm);
    if (vm.contains("config")) {
      boost::program_options::store(
          boost::program_options::parse_config_file(
              vm["config"].as<std::string>().c_str(), description),
          vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& ex) {
    std::cerr << ex.what() << std::endl;
    std::cerr << description << std::endl;
    return kInvalidUsage;
  }

  if (vm.contains("help") || opts.command.empty()) {
    std::cout << description << std::endl;
    return vm.contains("help") ? 0 : kInvalidUsage;
  }
  if (vm.contains("now")) {
    opts.now = now;
  }

  spdlog::init_thread_pool(8192, 1);
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto sinks = std::vector<spdlog::sink_ptr>{console_sink};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }
  auto logger = std::make_shared<spdlog::async_logger>(
      "floodgate", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  logger->set_level(spdlog::level::from_str(log_level));
  spdlog::set_default_logger(logger);

  auto exit_code = 0;
  try {
    if (opts.backend == "memory") {
      exit_code = run<floodgate::storage::memory_storage_tag>(opts);
    } else if (opts.backend == "rocksdb") {
      exit_code = run<floodgate::storage::rocksdb_storage_tag>(opts);
    } else {
      spdlog::error("Unknown backend '{}'", opts.backend);
      exit_code = kInvalidUsage;
    }
  } catch (const floodgate::storage::storage_error& ex) {
    spdlog::error("Storage failure: {}", ex.what());
    exit_code = static_cast<int>(transaction_error_code::storage_failure);
  }

  spdlog::shutdown();
  return exit_code;
}
