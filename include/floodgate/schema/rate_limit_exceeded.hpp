#pragma once

#include <floodgate/schema/path.hpp>
#include <floodgate/schema/primitives.hpp>
#include <string>

// Schema type: rate limit exceeded.
// Rejection detail for a transfer that would push a window past its cap.
// `used` is the balance before the attempt and `reset` is when the window
// that rejected it ends, so callers can decide when to retry.
namespace floodgate::schema {

template <uint16_t Version>
struct rate_limit_exceeded;

template <>
struct rate_limit_exceeded<1> final {
  uint16_t version{1};
  path_t path;
  amount_t amount{};
  std::string quota_name;
  amount_t used{};
  amount_t maximum{};
  timestamp_seconds_t reset{};
};

using rate_limit_exceeded_t = rate_limit_exceeded<1>;

}  // namespace floodgate::schema
