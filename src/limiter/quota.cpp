#include <floodgate/limiter/quota.hpp>

using namespace floodgate::schema;

namespace floodgate::limiter {

std::pair<amount_t, amount_t> capacity(const quota_t& quota) {
  return {quota.max_receive, quota.max_send};
}

amount_t capacity_on(const quota_t& quota, const flow_direction_t direction) {
  const auto [max_in, max_out] = capacity(quota);
  switch (direction) {
    case flow_direction_t::in:
      return max_in;
    case flow_direction_t::out:
      return max_out;
  }
  return max_out;
}

}  // namespace floodgate::limiter
