#pragma once

#include <floodgate/schema/primitives.hpp>

// Schema type: flow.
// Counters for the window ending at period_end. Windows are not aligned to a
// grid; a new one starts at the first call observed after the old one ended.
namespace floodgate::schema {

template <uint16_t Version>
struct flow;

template <>
struct flow<1> final {
  uint16_t version{1};
  amount_t inflow{};
  amount_t outflow{};
  timestamp_seconds_t period_end{};

  bool operator==(const flow<1>&) const = default;
};

using flow_t = flow<1>;

}  // namespace floodgate::schema
