#pragma once

#include <floodgate/schema/flow.hpp>
#include <floodgate/schema/quota.hpp>
#include <vector>

// Schema type: rate limit.
// One configured window for a path together with its live counters. The
// ordered list of these is the persisted value of a path.
namespace floodgate::schema {

template <uint16_t Version>
struct rate_limit;

template <>
struct rate_limit<1> final {
  uint16_t version{1};
  quota_t quota;
  flow_t flow;

  bool operator==(const rate_limit<1>&) const = default;
};

using rate_limit_t = rate_limit<1>;
using rate_limits_t = std::vector<rate_limit_t>;

}  // namespace floodgate::schema
