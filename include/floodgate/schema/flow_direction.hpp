#pragma once

#include <cstdint>

// Schema type: flow direction.
// Which counter a transfer touches: inbound value is bounded by the receive
// cap, outbound value by the send cap.
namespace floodgate::schema {

enum class flow_direction_t : uint8_t {
  in = 0,
  out = 1,
};

}  // namespace floodgate::schema
