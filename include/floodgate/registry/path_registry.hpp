#pragma once

#include <floodgate/schema/encoding/scale/encoder.hpp>
#include <floodgate/schema/key/engine_keys.hpp>
#include <floodgate/schema/path.hpp>
#include <floodgate/schema/rate_limit.hpp>
#include <floodgate/storage/storage.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace floodgate::registry {

using encoder_t = floodgate::schema::encoding::encoder<
    floodgate::schema::encoding::scale_encoder_tag>;

/// Keyed store of path -> ordered rate limit list.
///
/// A missing key means the path is unrestricted. The whole list is the unit
/// of persistence: it is always read and written back as one value, never
/// entry by entry.
template <typename Library>
class path_registry final {
 public:
  using storage_t = floodgate::storage::storage<Library>;

  path_registry(encoder_t& encoder, storage_t& storage)
      : encoder_{encoder}, storage_{storage} {}

  std::optional<floodgate::schema::rate_limits_t> load(
      const floodgate::schema::path_t& path) const {
    auto key = floodgate::schema::key::make_path_key(encoder_, path);
    return storage_.template get<floodgate::schema::rate_limits_t>(
        encoder_, floodgate::schema::bytes_view_t{key});
  }

  void save(const floodgate::schema::path_t& path,
            const floodgate::schema::rate_limits_t& limits) const {
    auto key = floodgate::schema::key::make_path_key(encoder_, path);
    storage_.put(encoder_, floodgate::schema::bytes_view_t{key}, limits);
  }

  /// Returns false when the path was not registered.
  bool remove(const floodgate::schema::path_t& path) const {
    auto key = floodgate::schema::key::make_path_key(encoder_, path);
    return storage_.remove(floodgate::schema::bytes_view_t{key});
  }

  bool contains(const floodgate::schema::path_t& path) const {
    return load(path).has_value();
  }

  /// Read-modify-write of one path.
  ///
  /// `mutator` receives the stored list (std::nullopt when unregistered) by
  /// reference and returns an optional error. The list is written back only
  /// when no error is returned and a list is present afterwards, so a failed
  /// mutation leaves storage exactly as it was.
  template <typename Mutator>
  auto update(const floodgate::schema::path_t& path, Mutator&& mutator) const {
    auto limits = load(path);
    auto error = std::forward<Mutator>(mutator)(limits);
    if (!error.has_value() && limits.has_value()) {
      save(path, *limits);
    }
    return error;
  }

  /// Every registered path, in key order.
  std::vector<floodgate::schema::path_t> list_paths() const {
    auto prefix = floodgate::schema::key::make_prefix_key(
        encoder_, floodgate::schema::key::kPathKeyPrefix);
    auto paths = std::vector<floodgate::schema::path_t>{};
    for (const auto& [key, value] :
         storage_.list_by_prefix(floodgate::schema::bytes_view_t{prefix})) {
      auto path = floodgate::schema::key::parse_path_key(
          encoder_, floodgate::schema::bytes_view_t{key});
      if (path.has_value()) {
        paths.push_back(std::move(*path));
      }
    }
    return paths;
  }

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace floodgate::registry
