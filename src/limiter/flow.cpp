#include <floodgate/limiter/flow.hpp>

using namespace floodgate::schema;

namespace floodgate::limiter {

flow_t make_flow(const timestamp_seconds_t now,
                 const duration_seconds_t duration) {
  auto flow = flow_t{};
  flow.period_end = saturating_add_duration(now, duration);
  return flow;
}

std::pair<amount_t, amount_t> balance(const flow_t& flow) {
  return {saturating_sub(flow.inflow, flow.outflow),
          saturating_sub(flow.outflow, flow.inflow)};
}

amount_t balance_on(const flow_t& flow, const flow_direction_t direction) {
  auto [balance_in, balance_out] = balance(flow);
  if (direction == flow_direction_t::in) {
    return balance_in;
  }
  return balance_out;
}

bool exceeds(const flow_t& flow,
             const flow_direction_t direction,
             const amount_t& max_in,
             const amount_t& max_out) {
  auto [balance_in, balance_out] = balance(flow);
  if (direction == flow_direction_t::in) {
    return balance_in > max_in;
  }
  return balance_out > max_out;
}

bool is_expired(const flow_t& flow, const timestamp_seconds_t now) {
  return flow.period_end < now;
}

void expire(flow_t& flow,
            const timestamp_seconds_t now,
            const duration_seconds_t duration) {
  flow.inflow = 0;
  flow.outflow = 0;
  flow.period_end = saturating_add_duration(now, duration);
}

void add_flow(flow_t& flow,
              const flow_direction_t direction,
              const amount_t& amount) {
  if (direction == flow_direction_t::in) {
    flow.inflow = saturating_add(flow.inflow, amount);
  } else {
    flow.outflow = saturating_add(flow.outflow, amount);
  }
}

void undo_flow(flow_t& flow,
               const flow_direction_t direction,
               const amount_t& amount) {
  if (direction == flow_direction_t::in) {
    flow.inflow = saturating_sub(flow.inflow, amount);
  } else {
    flow.outflow = saturating_sub(flow.outflow, amount);
  }
}

bool apply_transfer(flow_t& flow,
                    const flow_direction_t direction,
                    const amount_t& amount,
                    const timestamp_seconds_t now,
                    const quota_t& quota) {
  auto expired = false;
  if (is_expired(flow, now)) {
    expire(flow, now, quota.duration);
    expired = true;
  }
  add_flow(flow, direction, amount);
  return expired;
}

}  // namespace floodgate::limiter
