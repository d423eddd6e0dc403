#include <floodgate/schema/primitives.hpp>

#include <iterator>
#include <limits>
#include <string_view>

namespace floodgate::schema {

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

amount_t max_amount() {
  return std::numeric_limits<amount_t>::max();
}

amount_t saturating_add(const amount_t& a, const amount_t& b) {
  if (a > max_amount() - b) {
    return max_amount();
  }
  return a + b;
}

amount_t saturating_sub(const amount_t& a, const amount_t& b) {
  if (b >= a) {
    return amount_t{0};
  }
  return a - b;
}

timestamp_seconds_t saturating_add_duration(
    const timestamp_seconds_t now,
    const duration_seconds_t duration) {
  if (now > std::numeric_limits<timestamp_seconds_t>::max() - duration) {
    return std::numeric_limits<timestamp_seconds_t>::max();
  }
  return now + duration;
}

std::optional<amount_t> try_make_amount(const std::string_view value) {
  if (value.empty()) {
    return std::nullopt;
  }
  auto out = amount_t{0};
  for (const auto c : value) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    auto digit = static_cast<unsigned>(c - '0');
    if (out > (max_amount() - digit) / 10) {
      return std::nullopt;
    }
    out = out * 10 + digit;
  }
  return out;
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

}  // namespace floodgate::schema
