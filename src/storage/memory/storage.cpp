#include <floodgate/storage/memory/storage.hpp>

#include <algorithm>
#include <spdlog/spdlog.h>

namespace floodgate::storage {

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  if (!path.empty()) {
    spdlog::debug("Memory storage ignores path '{}'", path);
  }
  auto store = storage<memory_storage_tag>();
  store.entries = std::make_unique<
      std::map<floodgate::schema::bytes_t, floodgate::schema::bytes_t>>();
  return store;
}

bool storage<memory_storage_tag>::remove(
    const floodgate::schema::bytes_view_t& key) const {
  if (!entries) {
    floodgate::common::critical("memory storage is not initialized");
  }
  return entries->erase(floodgate::schema::make_bytes(key)) > 0;
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const floodgate::schema::bytes_view_t& prefix) const {
  if (!entries) {
    floodgate::common::critical("memory storage is not initialized");
  }
  auto out = std::vector<key_value_entry_t>{};
  auto prefix_bytes = floodgate::schema::make_bytes(prefix);
  for (auto it = entries->lower_bound(prefix_bytes); it != std::end(*entries);
       ++it) {
    const auto& key = it->first;
    if (key.size() < prefix_bytes.size() ||
        !std::equal(std::begin(prefix_bytes), std::end(prefix_bytes),
                    std::begin(key))) {
      break;
    }
    out.push_back(*it);
  }
  return out;
}

}  // namespace floodgate::storage
