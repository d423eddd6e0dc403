#pragma once
#include <floodgate/schema/primitives.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace floodgate::storage {

using key_value_entry_t =
    std::pair<floodgate::schema::bytes_t, floodgate::schema::bytes_t>;

/// Raised when a backend rejects a read or write, or holds bytes that no
/// longer decode. Nothing has been written when this escapes a call.
class storage_error : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const floodgate::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const floodgate::schema::bytes_view_t& key,
           const T& value) const;

  /// Delete key. Returns false when nothing was stored there.
  bool remove(const floodgate::schema::bytes_view_t& key) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const floodgate::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace floodgate::storage
