#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <utility>

// Label tables for schema enums. Each enum header defines a `k...Mappings`
// table, specializes try_from_string and provides a `to_string` overload with
// its own fallback label. Labels are matched exactly; no case folding.
namespace rxseal::schema {

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

template <typename Enum, std::size_t N>
constexpr std::string_view to_string_or(
    const Enum value,
    const enum_mappings_t<Enum, N>& mappings,
    const std::string_view fallback) {
  return to_string(value, mappings).value_or(fallback);
}

/// Specialized next to each enum; enums without a table do not link.
template <typename Enum>
std::optional<Enum> try_from_string(std::string_view value);

}  // namespace rxseal::schema
