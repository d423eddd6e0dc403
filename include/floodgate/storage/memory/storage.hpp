#pragma once
#include <floodgate/common/critical.hpp>
#include <floodgate/storage/storage.hpp>
#include <map>
#include <memory>
#include <string_view>

namespace floodgate::storage {

/// Ordered in-process map. Nothing survives the process; used for isolated
/// tests and dry runs.
struct memory_storage_tag {};

template <>
struct storage<memory_storage_tag> final {
  std::unique_ptr<std::map<floodgate::schema::bytes_t,
                           floodgate::schema::bytes_t>>
      entries;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const floodgate::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const floodgate::schema::bytes_view_t& key,
           const T& value) const;

  bool remove(const floodgate::schema::bytes_view_t& key) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const floodgate::schema::bytes_view_t& prefix) const;
};

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<memory_storage_tag>::get(
    Encoder& encoder,
    const floodgate::schema::bytes_view_t& key) const {
  if (!entries) {
    floodgate::common::critical("memory storage is not initialized");
  }
  auto found = entries->find(floodgate::schema::make_bytes(key));
  if (found == std::end(*entries)) {
    return std::nullopt;
  }
  auto decoded = encoder.template try_decode<T>(
      floodgate::schema::bytes_view_t{found->second});
  if (!decoded.has_value()) {
    throw storage_error{"failed to decode value stored in memory"};
  }
  return decoded;
}

template <typename T, typename Encoder>
void storage<memory_storage_tag>::put(
    Encoder& encoder,
    const floodgate::schema::bytes_view_t& key,
    const T& value) const {
  if (!entries) {
    floodgate::common::critical("memory storage is not initialized");
  }
  (*entries)[floodgate::schema::make_bytes(key)] = encoder.encode(value);
}

}  // namespace floodgate::storage
