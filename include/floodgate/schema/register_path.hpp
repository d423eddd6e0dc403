#pragma once

#include <floodgate/schema/path.hpp>
#include <floodgate/schema/quota.hpp>
#include <vector>

// Schema type: register path.
// Installs (or replaces) the quota list of a path. Every quota starts with
// zeroed counters and a window ending `duration` seconds after registration.
namespace floodgate::schema {

template <uint16_t Version>
struct register_path;

template <>
struct register_path<1> final {
  uint16_t version{1};
  path_t path;
  std::vector<quota_t> quotas;
};

using register_path_t = register_path<1>;

}  // namespace floodgate::schema
