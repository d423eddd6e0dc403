#pragma once

#include <floodgate/registry/path_registry.hpp>
#include <floodgate/schema/flow_direction.hpp>
#include <floodgate/schema/path.hpp>
#include <floodgate/schema/primitives.hpp>
#include <floodgate/schema/query_result.hpp>
#include <floodgate/schema/quota_not_found.hpp>
#include <floodgate/schema/rate_limit.hpp>
#include <floodgate/schema/rate_limit_exceeded.hpp>
#include <floodgate/schema/register_path.hpp>
#include <floodgate/schema/transaction.hpp>
#include <floodgate/schema/transaction_result.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace floodgate::execution {

/// Committed rate limits on success (empty when the path is unrestricted),
/// or the first window that refused the transfer.
using transfer_result_t = std::variant<floodgate::schema::rate_limits_t,
                                       floodgate::schema::rate_limit_exceeded_t>;

/// Velocity limiter over every registered path.
///
/// Each operation loads the path's rate limit list, works on copies, and
/// writes the list back as one value only when the whole operation succeeded.
/// Operations are serialized; the engine never reads a clock, every mutating
/// call takes the caller's notion of `now` in seconds.
template <typename Library>
class engine final {
 public:
  using registry_t = floodgate::registry::path_registry<Library>;

  explicit engine(registry_t& registry);

  /// Install (or overwrite) the quota list of a path with fresh windows.
  void register_path(const floodgate::schema::register_path_t& request,
                     floodgate::schema::timestamp_seconds_t now);

  /// Batch form of register_path, used when seeding a new store.
  ///
  /// All or nothing: a storage error restores every path already written in
  /// the batch to its previous state before the error propagates.
  void register_paths(
      const std::vector<floodgate::schema::register_path_t>& requests,
      floodgate::schema::timestamp_seconds_t now);

  /// Drop a path. Returns false when it was not registered.
  bool deregister_path(const floodgate::schema::path_t& path);

  /// Start a new window for the first quota named `quota_name`, leaving the
  /// other quotas of the path untouched.
  std::optional<floodgate::schema::quota_not_found_t> reset_path_quota(
      const floodgate::schema::path_t& path,
      std::string_view quota_name,
      floodgate::schema::timestamp_seconds_t now);

  /// Count a transfer against every quota of the path, all or nothing.
  ///
  /// Quotas are evaluated in list order and the first rejection wins. Nothing
  /// is persisted unless every quota accepts.
  transfer_result_t try_transfer(const floodgate::schema::path_t& path,
                                 const floodgate::schema::amount_t& amount,
                                 floodgate::schema::flow_direction_t direction,
                                 floodgate::schema::timestamp_seconds_t now);

  /// Take a previously counted outbound transfer back out of every quota.
  ///
  /// No limit checks and no window movement: if a window rolled since the
  /// send, the subtraction lands on fresh counters and saturates at zero.
  floodgate::schema::rate_limits_t undo_send(
      const floodgate::schema::path_t& path,
      const floodgate::schema::amount_t& amount);

  std::optional<floodgate::schema::rate_limits_t> query_state(
      const floodgate::schema::path_t& path) const;

  std::vector<floodgate::schema::path_t> list_paths() const;

  /// Dispatch a decoded message and report the outcome as a result code.
  floodgate::schema::transaction_result_t execute(
      const floodgate::schema::transaction_t& tx,
      floodgate::schema::timestamp_seconds_t now);

  /// Decode a SCALE transaction and execute it.
  floodgate::schema::transaction_result_t process_transaction(
      const floodgate::schema::bytes_view_t& raw_tx,
      floodgate::schema::timestamp_seconds_t now);

  /// Read-path query by route. Supported routes: "/path/quotas" (data is the
  /// SCALE tuple (owner, channel, asset)) and "/paths".
  floodgate::schema::query_result_t query(
      std::string_view route,
      const floodgate::schema::bytes_view_t& data) const;

 private:
  floodgate::schema::transaction_result_t execute_operation(
      const floodgate::schema::transaction_t& tx,
      floodgate::schema::timestamp_seconds_t now);

  floodgate::schema::transaction_result_t execute_transfer(
      const floodgate::schema::path_t& path,
      const floodgate::schema::amount_t& amount,
      floodgate::schema::flow_direction_t direction,
      floodgate::schema::timestamp_seconds_t now);

  mutable std::mutex mutex_;
  registry_t& registry_;
};

}  // namespace floodgate::execution
