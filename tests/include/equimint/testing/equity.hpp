#pragma once

#include <equimint/schema/payee.hpp>
#include <equimint/schema/primitives.hpp>
#include <equimint/testing/common.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <utility>
#include <vector>

namespace equimint::testing {

inline constexpr auto kFirstPayeeSeed = uint8_t{0x10};

/// Address `address_index` of payee `payee` in groups from make_payee_groups.
inline equimint::schema::address_t payee_address(const std::size_t payee,
                                                 const uint32_t address_index,
                                                 const uint32_t group_size = 3) {
  return make_address(static_cast<uint8_t>(
      kFirstPayeeSeed + (payee * group_size) + address_index));
}

/// `payees` groups of `group_size` distinct addresses, none shared.
inline std::vector<equimint::schema::payee_addresses_t> make_payee_groups(
    const std::size_t payees,
    const uint32_t group_size = 3) {
  auto groups = std::vector<equimint::schema::payee_addresses_t>{};
  for (std::size_t payee = 0; payee < payees; ++payee) {
    auto group = equimint::schema::payee_addresses_t{};
    for (uint32_t index = 0; index < group_size; ++index) {
      group.push_back(payee_address(payee, index, group_size));
    }
    groups.push_back(std::move(group));
  }
  return groups;
}

inline std::vector<equimint::schema::shares_t> make_shares(
    std::initializer_list<uint64_t> values) {
  auto shares = std::vector<equimint::schema::shares_t>{};
  for (const auto value : values) {
    shares.emplace_back(value);
  }
  return shares;
}

}  // namespace equimint::testing
