#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

// Name tables for the enums that cross the command line and result boundary
// (commands, error codes). Each enum pairs with a constexpr array of
// (name, value) mappings.
namespace equimint::schema {

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

/// All names of a table joined by `separator`, in table order.
template <typename Enum, std::size_t N>
std::string join_names(const enum_mappings_t<Enum, N>& mappings,
                       const std::string_view separator) {
  auto joined = std::string{};
  for (const auto& [name, enum_value] : mappings) {
    if (!joined.empty()) {
      joined += separator;
    }
    joined += name;
  }
  return joined;
}

/// Specialized per enum that has a name table.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view) {
  return std::nullopt;
}

}  // namespace equimint::schema
