#pragma once

#include <floodgate/schema/path.hpp>
#include <string>

// Schema type: reset path quota.
// Starts a fresh window for one named quota of a path.
namespace floodgate::schema {

template <uint16_t Version>
struct reset_path_quota;

template <>
struct reset_path_quota<1> final {
  uint16_t version{1};
  path_t path;
  std::string quota_name;
};

using reset_path_quota_t = reset_path_quota<1>;

}  // namespace floodgate::schema
