#include <floodgate/limiter/flow.hpp>
#include <floodgate/limiter/quota.hpp>
#include <floodgate/limiter/rate_limit.hpp>

using namespace floodgate::schema;

namespace floodgate::limiter {

allow_transfer_result_t allow_transfer(rate_limit_t limit,
                                       const path_t& path,
                                       const flow_direction_t direction,
                                       const amount_t& amount,
                                       const timestamp_seconds_t now) {
  const auto initial_flow = balance_on(limit.flow, direction);

  apply_transfer(limit.flow, direction, amount, now, limit.quota);

  const auto [max_in, max_out] = capacity(limit.quota);
  if (exceeds(limit.flow, direction, max_in, max_out)) {
    return rate_limit_exceeded_t{.path = path,
                                 .amount = amount,
                                 .quota_name = limit.quota.name,
                                 .used = initial_flow,
                                 .maximum = capacity_on(limit.quota, direction),
                                 .reset = limit.flow.period_end};
  }
  return limit;
}

}  // namespace floodgate::limiter
