#pragma once

#include <floodgate/schema/path.hpp>
#include <string>

// Schema type: quota not found.
// A targeted reset named a quota the path does not carry (or the path has no
// quotas at all).
namespace floodgate::schema {

template <uint16_t Version>
struct quota_not_found;

template <>
struct quota_not_found<1> final {
  uint16_t version{1};
  path_t path;
  std::string quota_name;
};

using quota_not_found_t = quota_not_found<1>;

}  // namespace floodgate::schema
