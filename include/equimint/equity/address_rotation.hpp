#pragma once

#include <equimint/equity/share_registry.hpp>
#include <equimint/schema/operation_result.hpp>
#include <equimint/schema/primitives.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <vector>

namespace equimint::equity {

/// Where an address sits in the payee configuration.
struct address_position final {
  equimint::schema::payee_index_t payee{};
  uint32_t address_index{};
};

/// Per-payee cursor over its backup addresses. Cursors only move forward;
/// addresses before the cursor are permanently disabled.
class address_rotation final {
 public:
  explicit address_rotation(const share_registry& registry);

  /// Advance the enabled address of `payee_index` on behalf of `caller`,
  /// who must hold a still-enabled address of a different payee.
  equimint::schema::operation_result_t advance(
      const share_registry& registry,
      const equimint::schema::address_t& caller,
      equimint::schema::payee_index_t payee_index);

  /// First occurrence in payee order, then address order.
  std::optional<address_position> locate(
      const equimint::schema::address_t& address) const;

  std::optional<uint32_t> enabled_index(
      equimint::schema::payee_index_t payee_index) const;

  std::optional<equimint::schema::address_t> enabled_address(
      const share_registry& registry,
      equimint::schema::payee_index_t payee_index) const;

  /// Reinstate a persisted cursor. Cursors never move backwards.
  bool restore(equimint::schema::payee_index_t payee_index,
               uint32_t enabled_index,
               uint32_t group_size);

 private:
  std::map<equimint::schema::address_t, address_position> positions_;
  std::vector<uint32_t> enabled_;
};

}  // namespace equimint::equity
