#pragma once

#include <equimint/schema/operation_result.hpp>
#include <equimint/schema/payee.hpp>
#include <equimint/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace equimint::equity {

inline constexpr auto kDefaultGroupSize = uint32_t{3};

/// Payees and their share weights, fixed at construction. A payee's index is
/// its position in the construction input.
class share_registry final {
 public:
  /// Validate the payee configuration. Checks run in order: length mismatch,
  /// no payees, address count, null addresses, zero shares, then total share
  /// overflow. On failure `result` carries the error and nothing is returned.
  static std::optional<share_registry> create(
      std::vector<equimint::schema::payee_addresses_t> groups,
      std::vector<equimint::schema::shares_t> shares,
      uint32_t group_size,
      equimint::schema::operation_result_t& result);

  std::size_t payee_count() const;
  uint32_t group_size() const;
  const equimint::schema::shares_t& total_shares() const;
  bool contains(equimint::schema::payee_index_t index) const;

  std::optional<equimint::schema::shares_t> shares_of(
      equimint::schema::payee_index_t index) const;
  std::optional<equimint::schema::payee_addresses_t> addresses_of(
      equimint::schema::payee_index_t index) const;

  const std::vector<equimint::schema::payee_addresses_t>& groups() const;
  const std::vector<equimint::schema::shares_t>& shares() const;

 private:
  share_registry(std::vector<equimint::schema::payee_addresses_t> groups,
                 std::vector<equimint::schema::shares_t> shares,
                 uint32_t group_size,
                 equimint::schema::shares_t total_shares);

  std::vector<equimint::schema::payee_addresses_t> groups_;
  std::vector<equimint::schema::shares_t> shares_;
  uint32_t group_size_{kDefaultGroupSize};
  equimint::schema::shares_t total_shares_{};
};

}  // namespace equimint::equity
