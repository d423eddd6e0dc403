#pragma once

#include <floodgate/schema/primitives.hpp>
#include <string>

// Schema type: path.
// Lookup key for rate limit state: (owner, channel, asset). The channel is
// always the local side of the bridge, on sends and receives alike.
namespace floodgate::schema {

template <uint16_t Version>
struct path;

template <>
struct path<1> final {
  uint16_t version{1};
  std::string owner;
  std::string channel;
  std::string asset;

  bool operator==(const path<1>&) const = default;
};

using path_t = path<1>;

}  // namespace floodgate::schema
