#pragma once
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace floodgate::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using amount_t = boost::multiprecision::uint128_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);

/// Largest representable amount; saturating addition clamps here.
amount_t max_amount();

/// a + b, clamped to max_amount() instead of wrapping.
amount_t saturating_add(const amount_t& a, const amount_t& b);

/// a - b, clamped to zero instead of wrapping.
amount_t saturating_sub(const amount_t& a, const amount_t& b);

/// now + duration, clamped to the largest timestamp.
timestamp_seconds_t saturating_add_duration(timestamp_seconds_t now,
                                            duration_seconds_t duration);

/// Parse a base-10 amount. Rejects empty input, signs, and values that do not
/// fit in 128 bits.
std::optional<amount_t> try_make_amount(std::string_view value);

std::string to_string(const amount_t& amount);

}  // namespace floodgate::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
