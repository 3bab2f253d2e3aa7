#pragma once
#include <equimint/schema/primitives.hpp>
#include <vector>

// Schema type: payee.
// Read-side view of one stakeholder: its ordered receiving addresses, share
// weight, cumulative released amount and the enabled-address cursor.
namespace equimint::schema {

using payee_addresses_t = std::vector<address_t>;

template <uint16_t Version>
struct payee;

template <>
struct payee<1> final {
  uint16_t version{1};
  payee_index_t index{};
  payee_addresses_t addresses;
  shares_t shares{};
  amount_t released{};
  uint32_t enabled_index{};
};

using payee_t = payee<1>;

}  // namespace equimint::schema
