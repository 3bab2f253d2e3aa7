#pragma once

#include <equimint/schema/event_attribute.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

// Schema type: event.
// Observability record journaled by the equity ledger and the mint authority
// (payee_added, address_rotated, payment_released, payment_received,
// asset_redeemed). Never consulted for control flow.
namespace equimint::schema {

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  std::string type;
  std::vector<event_attribute_t> attributes;
};

using event_t = event<1>;

inline event_attribute_t make_attribute(std::string key,
                                        std::string value,
                                        const bool index = false) {
  return event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

/// Return the value of the first attribute named `key`, if present.
inline const std::string* find_attribute(const event_t& event,
                                         const std::string& key) {
  for (const auto& attribute : event.attributes) {
    if (attribute.key == key) {
      return &attribute.value;
    }
  }
  return nullptr;
}

}  // namespace equimint::schema
