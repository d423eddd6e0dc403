#pragma once

#include <floodgate/schema/flow_direction.hpp>
#include <floodgate/schema/primitives.hpp>
#include <floodgate/schema/quota.hpp>
#include <utility>

namespace floodgate::limiter {

/// Caps as (max_in, max_out). The receive cap bounds inbound flow and the send
/// cap bounds outbound flow.
std::pair<floodgate::schema::amount_t, floodgate::schema::amount_t> capacity(
    const floodgate::schema::quota_t& quota);

/// The single cap that applies to `direction`.
floodgate::schema::amount_t capacity_on(
    const floodgate::schema::quota_t& quota,
    floodgate::schema::flow_direction_t direction);

}  // namespace floodgate::limiter
