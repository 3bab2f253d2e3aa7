#pragma once
#include <equimint/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace equimint::blake3 {

equimint::schema::hash32_t hash(const std::string_view& str);
equimint::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Hash the concatenation of several byte ranges without materializing it.
equimint::schema::hash32_t hash(
    std::initializer_list<std::span<const uint8_t>> parts);

}  // namespace equimint::blake3
