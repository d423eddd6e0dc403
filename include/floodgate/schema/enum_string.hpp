#pragma once

#include <array>
#include <floodgate/schema/flow_direction.hpp>
#include <optional>
#include <string_view>
#include <utility>

namespace floodgate::schema {

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::optional<std::string_view> to_string(
    const Enum value,
    const std::array<std::pair<std::string_view, Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

// First entry per value is the canonical spelling.
inline constexpr auto kFlowDirectionNames =
    std::array<std::pair<std::string_view, flow_direction_t>, 5>{{
        {"in", flow_direction_t::in},
        {"out", flow_direction_t::out},
        {"receive", flow_direction_t::in},
        {"recv", flow_direction_t::in},
        {"send", flow_direction_t::out},
    }};

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

template <>
inline std::optional<flow_direction_t> try_from_string<flow_direction_t>(
    const std::string_view value) {
  return from_string(value, kFlowDirectionNames);
}

inline std::string_view to_string(const flow_direction_t value) {
  return to_string(value, kFlowDirectionNames).value_or("unknown");
}

}  // namespace floodgate::schema
