#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

namespace mandate::schema {

/// Name table for an enum, used for CLI arguments and event attributes.
template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const enum_mappings_t<Enum, N>& mappings) {
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
    const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return std::nullopt;
}

/// Specialized beside each enum that has a name table; there is no generic
/// fallback.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace mandate::schema
