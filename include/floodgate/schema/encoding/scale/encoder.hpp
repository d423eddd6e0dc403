#pragma once
#include <floodgate/common/critical.hpp>
#include <floodgate/schema/encoding/encoder.hpp>
#include <floodgate/schema/encoding/scale/deregister_path.hpp>
#include <floodgate/schema/encoding/scale/flow.hpp>
#include <floodgate/schema/encoding/scale/flow_direction.hpp>
#include <floodgate/schema/encoding/scale/path.hpp>
#include <floodgate/schema/encoding/scale/query_result.hpp>
#include <floodgate/schema/encoding/scale/quota.hpp>
#include <floodgate/schema/encoding/scale/quota_not_found.hpp>
#include <floodgate/schema/encoding/scale/rate_limit.hpp>
#include <floodgate/schema/encoding/scale/rate_limit_exceeded.hpp>
#include <floodgate/schema/encoding/scale/register_path.hpp>
#include <floodgate/schema/encoding/scale/reset_path_quota.hpp>
#include <floodgate/schema/encoding/scale/transaction.hpp>
#include <floodgate/schema/encoding/scale/transaction_event.hpp>
#include <floodgate/schema/encoding/scale/transaction_event_attribute.hpp>
#include <floodgate/schema/encoding/scale/transaction_result.hpp>
#include <floodgate/schema/encoding/scale/transfer.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace floodgate::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  floodgate::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, floodgate::schema::bytes_t& out);

  template <typename T>
  T decode(const floodgate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const floodgate::schema::bytes_view_t& bytes);
};

template <typename T>
floodgate::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    floodgate::common::critical("failed to encode SCALE object: {}",
                                encoded.error().message());
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        floodgate::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const floodgate::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    floodgate::common::critical("failed to decode {} SCALE bytes: {}",
                                bytes.size(), decoded.error().message());
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const floodgate::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace floodgate::schema::encoding
