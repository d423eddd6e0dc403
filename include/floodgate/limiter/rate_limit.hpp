#pragma once

#include <floodgate/schema/flow_direction.hpp>
#include <floodgate/schema/path.hpp>
#include <floodgate/schema/primitives.hpp>
#include <floodgate/schema/rate_limit.hpp>
#include <floodgate/schema/rate_limit_exceeded.hpp>
#include <variant>

namespace floodgate::limiter {

using allow_transfer_result_t =
    std::variant<floodgate::schema::rate_limit_t,
                 floodgate::schema::rate_limit_exceeded_t>;

/// Evaluate one transfer against one window.
///
/// `limit` is taken by value: the returned rate limit carries the updated
/// flow on success, and on rejection the attempt leaves the caller's copy
/// untouched. The rejection reports the balance from before the attempt and
/// the (possibly rolled) period_end.
allow_transfer_result_t allow_transfer(
    floodgate::schema::rate_limit_t limit,
    const floodgate::schema::path_t& path,
    floodgate::schema::flow_direction_t direction,
    const floodgate::schema::amount_t& amount,
    floodgate::schema::timestamp_seconds_t now);

}  // namespace floodgate::limiter
