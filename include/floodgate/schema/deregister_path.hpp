#pragma once

#include <floodgate/schema/path.hpp>

// Schema type: deregister path.
// Drops all quota state for a path; the path becomes unrestricted.
namespace floodgate::schema {

template <uint16_t Version>
struct deregister_path;

template <>
struct deregister_path<1> final {
  uint16_t version{1};
  path_t path;
};

using deregister_path_t = deregister_path<1>;

}  // namespace floodgate::schema
