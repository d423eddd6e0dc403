#pragma once

#include <floodgate/schema/path.hpp>
#include <floodgate/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

// Schema key type: engine keys.
// Canonical key prefixes and key codecs for persisted rate limit state.
namespace floodgate::schema::key {

inline constexpr std::string_view kPathKeyPrefix{"SYS|STATE|PATH|"};

template <typename Encoder, typename T>
floodgate::schema::bytes_t make_prefixed_key(Encoder& encoder,
                                             std::string_view prefix,
                                             const T& id) {
  // SCALE product types are encoded as concatenated field bytes.
  // This is equivalent to encoding tuple{prefix, id}.
  auto key = encoder.encode(prefix);
  encoder.encode(id, key);
  return key;
}

template <typename Encoder>
floodgate::schema::bytes_t make_prefix_key(Encoder& encoder,
                                           std::string_view prefix) {
  return encoder.encode(prefix);
}

template <typename Encoder>
floodgate::schema::bytes_t make_path_key(Encoder& encoder,
                                         const floodgate::schema::path_t& path) {
  return make_prefixed_key(encoder, kPathKeyPrefix,
                           std::tuple{path.owner, path.channel, path.asset});
}

template <typename Encoder>
std::optional<floodgate::schema::path_t> parse_path_key(
    Encoder& encoder,
    const floodgate::schema::bytes_view_t& key) {
  auto decoded = encoder.template try_decode<std::tuple<
      std::string, std::tuple<std::string, std::string, std::string>>>(key);
  if (!decoded.has_value()) {
    return std::nullopt;
  }
  if (std::get<0>(decoded.value()) != kPathKeyPrefix) {
    return std::nullopt;
  }
  const auto& [owner, channel, asset] = std::get<1>(decoded.value());
  return floodgate::schema::path_t{
      .owner = owner, .channel = channel, .asset = asset};
}

}  // namespace floodgate::schema::key
