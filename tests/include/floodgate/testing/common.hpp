#pragma once

#include <floodgate/schema/path.hpp>
#include <floodgate/schema/primitives.hpp>
#include <floodgate/schema/quota.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace floodgate::testing {

inline constexpr floodgate::schema::duration_seconds_t kDay = 86400;
inline constexpr floodgate::schema::duration_seconds_t kWeek = 604800;

inline floodgate::schema::path_t make_path(
    const std::string_view owner = "contract0",
    const std::string_view channel = "channel-0",
    const std::string_view asset = "uosmo") {
  return floodgate::schema::path_t{.owner = std::string{owner},
                                   .channel = std::string{channel},
                                   .asset = std::string{asset}};
}

inline floodgate::schema::quota_t make_quota(
    const std::string_view name,
    const floodgate::schema::duration_seconds_t duration,
    const uint64_t max_send,
    const uint64_t max_receive) {
  return floodgate::schema::quota_t{
      .name = std::string{name},
      .max_send = floodgate::schema::amount_t{max_send},
      .max_receive = floodgate::schema::amount_t{max_receive},
      .duration = duration};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace floodgate::testing
