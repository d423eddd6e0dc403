#include <spdlog/spdlog.h>
#include <algorithm>
#include <floodgate/execution/engine.hpp>
#include <floodgate/limiter/flow.hpp>
#include <floodgate/limiter/quota.hpp>
#include <floodgate/limiter/rate_limit.hpp>
#include <floodgate/schema/encoding/scale/encoder.hpp>
#include <floodgate/schema/enum_string.hpp>
#include <floodgate/schema/query_error_code.hpp>
#include <floodgate/schema/transaction_error_code.hpp>
#include <floodgate/storage/memory/storage.hpp>
#include <floodgate/storage/rocksdb/storage.hpp>
#include <iterator>
#include <string>
#include <tuple>
#include <utility>

using namespace floodgate::schema;

namespace {

using encoder_t = floodgate::schema::encoding::encoder<
    floodgate::schema::encoding::scale_encoder_tag>;

constexpr auto kExecuteCodespace = std::string_view{"floodgate.execute"};
constexpr auto kQueryCodespace = std::string_view{"floodgate.query"};
constexpr auto kPathQuotasRoute = std::string_view{"/path/quotas"};
constexpr auto kPathsRoute = std::string_view{"/paths"};

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx.has_value()) {
    error = "failed to decode SCALE transaction";
  }
  return tx;
}

std::string describe(const path_t& path) {
  return path.owner + path.channel + "/" + path.asset;
}

std::string describe(const rate_limit_exceeded_t& error) {
  return "rate limit exceeded for " + describe(error.path) +
         ". Tried to transfer " + to_string(error.amount) +
         " which exceeds capacity on the '" + error.quota_name + "' quota (" +
         to_string(error.used) + "/" + to_string(error.maximum) +
         "). Try again after " + std::to_string(error.reset);
}

std::string describe(const quota_not_found_t& error) {
  return "quota " + error.quota_name + " not found for channel " +
         error.path.channel;
}

rate_limits_t make_rate_limits(const register_path_t& request,
                               const timestamp_seconds_t now) {
  auto limits = rate_limits_t{};
  limits.reserve(request.quotas.size());
  for (const auto& quota : request.quotas) {
    limits.push_back(rate_limit_t{
        .quota = quota,
        .flow = floodgate::limiter::make_flow(now, quota.duration)});
  }
  return limits;
}

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             const bool index = false) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

transaction_event_t make_path_event(const std::string_view method,
                                    const path_t& path) {
  auto event = transaction_event_t{};
  event.type = std::string{method};
  event.attributes.push_back(make_attribute("method", std::string{method}));
  event.attributes.push_back(make_attribute("owner", path.owner, true));
  event.attributes.push_back(make_attribute("channel_id", path.channel, true));
  event.attributes.push_back(make_attribute("asset", path.asset, true));
  return event;
}

void add_rate_limit_attributes(transaction_event_t& event,
                               const rate_limit_t& limit) {
  const auto [used_in, used_out] = floodgate::limiter::balance(limit.flow);
  const auto [max_in, max_out] = floodgate::limiter::capacity(limit.quota);
  const auto& name = limit.quota.name;
  event.attributes.push_back(make_attribute(name + "_used_in",
                                            to_string(used_in)));
  event.attributes.push_back(make_attribute(name + "_used_out",
                                            to_string(used_out)));
  event.attributes.push_back(make_attribute(name + "_max_in",
                                            to_string(max_in)));
  event.attributes.push_back(make_attribute(name + "_max_out",
                                            to_string(max_out)));
  event.attributes.push_back(make_attribute(
      name + "_period_end", std::to_string(limit.flow.period_end)));
}

transaction_result_t make_error_result(const transaction_error_code code,
                                       std::string log,
                                       std::string info = {}) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{kExecuteCodespace};
  return result;
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const bytes_view_t& key) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

}  // namespace

namespace floodgate::execution {

template <typename Library>
engine<Library>::engine(registry_t& registry) : registry_{registry} {
  spdlog::info("Execution engine ready");
}

template <typename Library>
void engine<Library>::register_path(const register_path_t& request,
                                    const timestamp_seconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto limits = make_rate_limits(request, now);
  registry_.save(request.path, limits);
  spdlog::info("Registered path {} with {} quota(s)", describe(request.path),
               limits.size());
}

template <typename Library>
void engine<Library>::register_paths(
    const std::vector<register_path_t>& requests,
    const timestamp_seconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto previous = std::vector<std::optional<rate_limits_t>>{};
  previous.reserve(requests.size());
  for (const auto& request : requests) {
    previous.push_back(registry_.load(request.path));
  }

  auto written = size_t{0};
  try {
    for (const auto& request : requests) {
      registry_.save(request.path, make_rate_limits(request, now));
      ++written;
    }
  } catch (const floodgate::storage::storage_error& ex) {
    spdlog::error("Registering {} path(s) failed after {}: {}",
                  requests.size(), written, ex.what());
    for (auto i = written; i > 0; --i) {
      const auto& path = requests[i - 1].path;
      if (previous[i - 1].has_value()) {
        registry_.save(path, *previous[i - 1]);
      } else {
        registry_.remove(path);
      }
    }
    throw;
  }
  spdlog::info("Registered {} path(s)", requests.size());
}

template <typename Library>
bool engine<Library>::deregister_path(const path_t& path) {
  auto lock = std::scoped_lock{mutex_};
  auto removed = registry_.remove(path);
  if (removed) {
    spdlog::info("Deregistered path {}", describe(path));
  } else {
    spdlog::debug("Deregister of unknown path {}", describe(path));
  }
  return removed;
}

template <typename Library>
std::optional<quota_not_found_t> engine<Library>::reset_path_quota(
    const path_t& path,
    const std::string_view quota_name,
    const timestamp_seconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto error = registry_.update(
      path,
      [&](std::optional<rate_limits_t>& limits)
          -> std::optional<quota_not_found_t> {
        auto not_found = quota_not_found_t{
            .path = path, .quota_name = std::string{quota_name}};
        if (!limits.has_value()) {
          return not_found;
        }
        auto match = std::ranges::find_if(
            *limits, [&](const rate_limit_t& limit) {
              return limit.quota.name == quota_name;
            });
        if (match == std::end(*limits)) {
          return not_found;
        }
        floodgate::limiter::expire(match->flow, now, match->quota.duration);
        return std::nullopt;
      });
  if (error.has_value()) {
    spdlog::warn("Reset rejected: {}", describe(*error));
  } else {
    spdlog::info("Reset quota '{}' on path {}", quota_name, describe(path));
  }
  return error;
}

template <typename Library>
transfer_result_t engine<Library>::try_transfer(
    const path_t& path,
    const amount_t& amount,
    const flow_direction_t direction,
    const timestamp_seconds_t now) {
  auto lock = std::scoped_lock{mutex_};
  auto committed = rate_limits_t{};
  auto rejection = registry_.update(
      path,
      [&](std::optional<rate_limits_t>& limits)
          -> std::optional<rate_limit_exceeded_t> {
        if (!limits.has_value() || limits->empty()) {
          // Unrestricted path: nothing to evaluate and nothing to write.
          limits.reset();
          return std::nullopt;
        }
        auto results = rate_limits_t{};
        results.reserve(limits->size());
        for (const auto& limit : *limits) {
          auto outcome = floodgate::limiter::allow_transfer(
              limit, path, direction, amount, now);
          if (auto* exceeded = std::get_if<rate_limit_exceeded_t>(&outcome)) {
            return *exceeded;
          }
          results.push_back(std::get<rate_limit_t>(std::move(outcome)));
        }
        *limits = results;
        committed = std::move(results);
        return std::nullopt;
      });

  if (rejection.has_value()) {
    spdlog::warn("Transfer rejected: {}", describe(*rejection));
    return *rejection;
  }
  spdlog::debug("Transfer of {} {} on {} accepted by {} quota(s)",
                to_string(amount), to_string(direction), describe(path),
                committed.size());
  return committed;
}

template <typename Library>
rate_limits_t engine<Library>::undo_send(const path_t& path,
                                         const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto limits = registry_.load(path);
  if (!limits.has_value() || limits->empty()) {
    spdlog::debug("Undo on unrestricted path {}", describe(path));
    return {};
  }
  for (auto& limit : *limits) {
    floodgate::limiter::undo_flow(limit.flow, flow_direction_t::out, amount);
  }
  registry_.save(path, *limits);
  spdlog::debug("Reverted outbound transfer of {} on {}", to_string(amount),
                describe(path));
  return *limits;
}

template <typename Library>
std::optional<rate_limits_t> engine<Library>::query_state(
    const path_t& path) const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.load(path);
}

template <typename Library>
std::vector<path_t> engine<Library>::list_paths() const {
  auto lock = std::scoped_lock{mutex_};
  return registry_.list_paths();
}

template <typename Library>
transaction_result_t engine<Library>::execute(const transaction_t& tx,
                                              const timestamp_seconds_t now) {
  if (tx.version != 1) {
    return make_error_result(
        transaction_error_code::unsupported_transaction_version,
        "unsupported transaction version", "expected version 1");
  }
  try {
    return execute_operation(tx, now);
  } catch (const floodgate::storage::storage_error& ex) {
    spdlog::error("Storage failure while executing transaction: {}",
                  ex.what());
    return make_error_result(transaction_error_code::storage_failure,
                             "storage failure", ex.what());
  }
}

template <typename Library>
transaction_result_t engine<Library>::process_transaction(
    const bytes_view_t& raw_tx,
    const timestamp_seconds_t now) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_error_result(transaction_error_code::invalid_transaction,
                             "invalid transaction", decode_error);
  }
  return execute(*maybe_tx, now);
}

template <typename Library>
query_result_t engine<Library>::query(const std::string_view route,
                                      const bytes_view_t& data) const {
  auto encoder = encoder_t{};
  try {
    if (route == kPathQuotasRoute) {
      auto key = encoder.try_decode<std::tuple<std::string, std::string,
                                               std::string>>(data);
      if (!key.has_value()) {
        return make_query_error(query_error_code::invalid_key,
                                "invalid path key", data);
      }
      const auto& [owner, channel, asset] = key.value();
      auto limits = query_state(
          path_t{.owner = owner, .channel = channel, .asset = asset});
      if (!limits.has_value()) {
        return make_query_error(query_error_code::not_found,
                                "path not found", data);
      }
      auto result = query_result_t{};
      result.key = make_bytes(data);
      result.value = encoder.encode(*limits);
      result.codespace = std::string{kQueryCodespace};
      return result;
    }
    if (route == kPathsRoute) {
      auto result = query_result_t{};
      result.value = encoder.encode(list_paths());
      result.codespace = std::string{kQueryCodespace};
      return result;
    }
  } catch (const floodgate::storage::storage_error& ex) {
    spdlog::error("Storage failure while serving query {}: {}", route,
                  ex.what());
    return make_query_error(query_error_code::storage_failure, ex.what(),
                            data);
  }
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", data);
}

template <typename Library>
transaction_result_t engine<Library>::execute_operation(
    const transaction_t& tx,
    const timestamp_seconds_t now) {
  auto result = transaction_result_t{};
  std::visit(
      overloaded{
          [&](const register_path_t& request) {
            register_path(request, now);
            auto event = make_path_event("register_path", request.path);
            event.attributes.push_back(make_attribute(
                "quotas", std::to_string(request.quotas.size())));
            result.events.push_back(std::move(event));
          },
          [&](const deregister_path_t& request) {
            auto removed = deregister_path(request.path);
            result.info = removed ? "path removed" : "path was not registered";
            result.events.push_back(
                make_path_event("deregister_path", request.path));
          },
          [&](const reset_path_quota_t& request) {
            auto error =
                reset_path_quota(request.path, request.quota_name, now);
            if (error.has_value()) {
              result = make_error_result(transaction_error_code::quota_not_found,
                                         describe(*error), error->quota_name);
              return;
            }
            auto event = make_path_event("reset_path_quota", request.path);
            event.attributes.push_back(
                make_attribute("quota", request.quota_name));
            result.events.push_back(std::move(event));
          },
          [&](const send_transfer_t& request) {
            result = execute_transfer(request.path, request.amount,
                                      flow_direction_t::out, now);
          },
          [&](const receive_transfer_t& request) {
            result = execute_transfer(request.path, request.amount,
                                      flow_direction_t::in, now);
          },
          [&](const undo_send_t& request) {
            auto limits = undo_send(request.path, request.amount);
            auto event = make_path_event("undo_send", request.path);
            if (limits.empty()) {
              event.attributes.push_back(make_attribute("quota", "none"));
            }
            result.events.push_back(std::move(event));
          }},
      tx.payload);
  return result;
}

template <typename Library>
transaction_result_t engine<Library>::execute_transfer(
    const path_t& path,
    const amount_t& amount,
    const flow_direction_t direction,
    const timestamp_seconds_t now) {
  auto outcome = try_transfer(path, amount, direction, now);
  if (auto* exceeded = std::get_if<rate_limit_exceeded_t>(&outcome)) {
    auto result =
        make_error_result(transaction_error_code::rate_limit_exceeded,
                          describe(*exceeded), exceeded->quota_name);
    result.data = encoder_t{}.encode(*exceeded);
    return result;
  }

  auto result = transaction_result_t{};
  auto event = make_path_event("try_transfer", path);
  event.attributes.push_back(
      make_attribute("direction", std::string{to_string(direction)}));
  const auto& limits = std::get<rate_limits_t>(outcome);
  if (limits.empty()) {
    event.attributes.push_back(make_attribute("quota", "none"));
  }
  for (const auto& limit : limits) {
    add_rate_limit_attributes(event, limit);
  }
  result.events.push_back(std::move(event));
  return result;
}

template class engine<floodgate::storage::rocksdb_storage_tag>;
template class engine<floodgate::storage::memory_storage_tag>;

}  // namespace floodgate::execution
