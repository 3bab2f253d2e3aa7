#include <equimint/equity/address_rotation.hpp>

#include <string>

using namespace equimint::schema;

namespace equimint::equity {

address_rotation::address_rotation(const share_registry& registry)
    : enabled_(registry.payee_count(), 0) {
  const auto& groups = registry.groups();
  for (std::size_t payee = 0; payee < groups.size(); ++payee) {
    for (std::size_t index = 0; index < groups[payee].size(); ++index) {
      positions_.try_emplace(
          groups[payee][index],
          address_position{.payee = static_cast<payee_index_t>(payee),
                           .address_index = static_cast<uint32_t>(index)});
    }
  }
}

operation_result_t address_rotation::advance(const share_registry& registry,
                                             const address_t& caller,
                                             const payee_index_t payee_index) {
  if (payee_index >= enabled_.size()) {
    return make_error(error_code::bad_payee_index, kEquityCodespace,
                      "bad payee index", std::to_string(payee_index));
  }
  if (enabled_[payee_index] + 1 >= registry.group_size()) {
    return make_error(error_code::all_addresses_used, kEquityCodespace,
                      "all addresses already used",
                      "payee " + std::to_string(payee_index));
  }

  auto position = locate(caller);
  if (!position.has_value()) {
    return make_error(error_code::caller_not_payee, kEquityCodespace,
                      "caller is not a payee", to_string(caller));
  }
  if (position->payee == payee_index) {
    return make_error(error_code::self_rotation_forbidden, kEquityCodespace,
                      "payee cannot rotate its own addresses",
                      to_string(caller));
  }
  if (position->address_index < enabled_[position->payee]) {
    return make_error(error_code::caller_address_disabled, kEquityCodespace,
                      "caller payee address is disabled", to_string(caller));
  }

  ++enabled_[payee_index];
  return operation_result_t{};
}

std::optional<address_position> address_rotation::locate(
    const address_t& address) const {
  auto it = positions_.find(address);
  if (it == std::end(positions_)) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<uint32_t> address_rotation::enabled_index(
    const payee_index_t payee_index) const {
  if (payee_index >= enabled_.size()) {
    return std::nullopt;
  }
  return enabled_[payee_index];
}

std::optional<address_t> address_rotation::enabled_address(
    const share_registry& registry,
    const payee_index_t payee_index) const {
  if (payee_index >= enabled_.size() || !registry.contains(payee_index)) {
    return std::nullopt;
  }
  return registry.groups()[payee_index][enabled_[payee_index]];
}

bool address_rotation::restore(const payee_index_t payee_index,
                               const uint32_t enabled_index,
                               const uint32_t group_size) {
  if (payee_index >= enabled_.size() || enabled_index >= group_size ||
      enabled_index < enabled_[payee_index]) {
    return false;
  }
  enabled_[payee_index] = enabled_index;
  return true;
}

}  // namespace equimint::equity
