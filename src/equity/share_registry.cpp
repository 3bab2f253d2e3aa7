#include <equimint/equity/share_registry.hpp>

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

using namespace equimint::schema;

namespace equimint::equity {

std::optional<share_registry> share_registry::create(
    std::vector<payee_addresses_t> groups,
    std::vector<shares_t> shares,
    const uint32_t group_size,
    operation_result_t& result) {
  if (groups.size() != shares.size()) {
    result = make_error(error_code::length_mismatch, kEquityCodespace,
                        "payees and shares length mismatch",
                        std::to_string(groups.size()) + " payee(s), " +
                            std::to_string(shares.size()) + " share count(s)");
    return std::nullopt;
  }
  if (groups.empty()) {
    result = make_error(error_code::no_payees, kEquityCodespace, "no payees");
    return std::nullopt;
  }
  if (group_size < 2) {
    result = make_error(error_code::bad_address_count, kEquityCodespace,
                        "bad payee addresses number",
                        "group size must be at least 2");
    return std::nullopt;
  }
  for (std::size_t i = 0; i < groups.size(); ++i) {
    if (groups[i].size() != group_size) {
      result = make_error(error_code::bad_address_count, kEquityCodespace,
                          "bad payee addresses number",
                          "payee " + std::to_string(i) + " has " +
                              std::to_string(groups[i].size()) +
                              " address(es), expected " +
                              std::to_string(group_size));
      return std::nullopt;
    }
  }
  for (std::size_t i = 0; i < groups.size(); ++i) {
    if (std::any_of(std::begin(groups[i]), std::end(groups[i]),
                    [](const address_t& address) { return is_zero(address); })) {
      result = make_error(error_code::zero_address, kEquityCodespace,
                          "address is the zero address",
                          "payee " + std::to_string(i));
      return std::nullopt;
    }
  }

  auto total = shares_t{};
  for (std::size_t i = 0; i < shares.size(); ++i) {
    if (shares[i] == 0) {
      result = make_error(error_code::zero_shares, kEquityCodespace,
                          "shares are 0", "payee " + std::to_string(i));
      return std::nullopt;
    }
    if (total > (std::numeric_limits<shares_t>::max)() - shares[i]) {
      result = make_error(error_code::arithmetic_overflow, kEquityCodespace,
                          "total shares overflow");
      return std::nullopt;
    }
    total += shares[i];
  }

  result = operation_result_t{};
  return share_registry{std::move(groups), std::move(shares), group_size,
                        total};
}

share_registry::share_registry(std::vector<payee_addresses_t> groups,
                               std::vector<shares_t> shares,
                               const uint32_t group_size,
                               shares_t total_shares)
    : groups_{std::move(groups)},
      shares_{std::move(shares)},
      group_size_{group_size},
      total_shares_{std::move(total_shares)} {}

std::size_t share_registry::payee_count() const {
  return groups_.size();
}

uint32_t share_registry::group_size() const {
  return group_size_;
}

const shares_t& share_registry::total_shares() const {
  return total_shares_;
}

bool share_registry::contains(const payee_index_t index) const {
  return index < groups_.size();
}

std::optional<shares_t> share_registry::shares_of(
    const payee_index_t index) const {
  if (!contains(index)) {
    return std::nullopt;
  }
  return shares_[index];
}

std::optional<payee_addresses_t> share_registry::addresses_of(
    const payee_index_t index) const {
  if (!contains(index)) {
    return std::nullopt;
  }
  return groups_[index];
}

const std::vector<payee_addresses_t>& share_registry::groups() const {
  return groups_;
}

const std::vector<shares_t>& share_registry::shares() const {
  return shares_;
}

}  // namespace equimint::equity
