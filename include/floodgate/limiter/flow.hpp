#pragma once

#include <floodgate/schema/flow.hpp>
#include <floodgate/schema/flow_direction.hpp>
#include <floodgate/schema/primitives.hpp>
#include <floodgate/schema/quota.hpp>
#include <utility>

// Window and netting arithmetic for a single flow.
//
// Transfers in opposite directions cancel each other: quota consumption
// follows the net balance, never gross volume. Windows roll over lazily; the
// first call after period_end starts one fresh window anchored at that call,
// however long the path was idle.
namespace floodgate::limiter {

/// Zeroed counters with a window ending `duration` seconds after `now`.
floodgate::schema::flow_t make_flow(floodgate::schema::timestamp_seconds_t now,
                                    floodgate::schema::duration_seconds_t
                                        duration);

/// Net balance as (balance_in, balance_out). At most one side is non-zero.
std::pair<floodgate::schema::amount_t, floodgate::schema::amount_t> balance(
    const floodgate::schema::flow_t& flow);

/// Net balance in one direction.
floodgate::schema::amount_t balance_on(
    const floodgate::schema::flow_t& flow,
    floodgate::schema::flow_direction_t direction);

/// True when the net balance in `direction` is above the matching cap.
bool exceeds(const floodgate::schema::flow_t& flow,
             floodgate::schema::flow_direction_t direction,
             const floodgate::schema::amount_t& max_in,
             const floodgate::schema::amount_t& max_out);

/// period_end < now. A call at exactly period_end is still in the window.
bool is_expired(const floodgate::schema::flow_t& flow,
                floodgate::schema::timestamp_seconds_t now);

/// Zero both counters and start a window ending at now + duration. Also
/// used by administrative resets.
void expire(floodgate::schema::flow_t& flow,
            floodgate::schema::timestamp_seconds_t now,
            floodgate::schema::duration_seconds_t duration);

/// Saturating increment of the counter for `direction`.
void add_flow(floodgate::schema::flow_t& flow,
              floodgate::schema::flow_direction_t direction,
              const floodgate::schema::amount_t& amount);

/// Saturating decrement of the counter for `direction`. Never checks or moves
/// the window.
void undo_flow(floodgate::schema::flow_t& flow,
               floodgate::schema::flow_direction_t direction,
               const floodgate::schema::amount_t& amount);

/// Roll the window if it has expired, then add the transfer. Returns true
/// when the window was rolled. Never rejects.
bool apply_transfer(floodgate::schema::flow_t& flow,
                    floodgate::schema::flow_direction_t direction,
                    const floodgate::schema::amount_t& amount,
                    floodgate::schema::timestamp_seconds_t now,
                    const floodgate::schema::quota_t& quota);

}  // namespace floodgate::limiter
