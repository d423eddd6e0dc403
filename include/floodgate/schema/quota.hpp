#pragma once

#include <floodgate/schema/primitives.hpp>
#include <string>

// Schema type: quota.
// Window configuration: how much may net-flow in each direction within
// `duration` seconds. The name is expected to describe the window ("daily",
// "weekly", ...) and is the handle used by targeted resets.
namespace floodgate::schema {

template <uint16_t Version>
struct quota;

template <>
struct quota<1> final {
  uint16_t version{1};
  std::string name;
  amount_t max_send{};
  amount_t max_receive{};
  duration_seconds_t duration{};

  bool operator==(const quota<1>&) const = default;
};

using quota_t = quota<1>;

}  // namespace floodgate::schema
