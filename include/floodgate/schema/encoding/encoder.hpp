#pragma once
#include <floodgate/schema/primitives.hpp>
#include <optional>
#include <span>

namespace floodgate::schema::encoding {

// The codec is a build time choice made by picking a library tag, in the same
// way storage backends are chosen. Hot swapping is not a design goal.
template <typename Library>
struct encoder {
  template <typename T>
  floodgate::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, floodgate::schema::bytes_t& out);

  template <typename T>
  T decode(const floodgate::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const floodgate::schema::bytes_view_t& bytes);
};

}  // namespace floodgate::schema::encoding
