#include <equimint/equity/payment_distributor.hpp>

#include <boost/multiprecision/cpp_int.hpp>

#include <exception>
#include <iterator>
#include <limits>
#include <numeric>
#include <string>
#include <utility>

using namespace equimint::schema;

namespace equimint::equity {

namespace {

using wide_amount_t = boost::multiprecision::uint512_t;

}  // namespace

payment_distributor::payment_distributor(const std::size_t payee_count)
    : released_(payee_count, amount_t{}) {}

operation_result_t payment_distributor::receive(const amount_t& amount) {
  const auto headroom =
      amount_t{(std::numeric_limits<amount_t>::max)() - total_received()};
  if (amount > headroom) {
    return make_error(error_code::arithmetic_overflow, kEquityCodespace,
                      "received balance overflow", amount.str());
  }
  held_ += amount;
  return operation_result_t{};
}

operation_result_t payment_distributor::release(
    const share_registry& registry,
    const address_rotation& rotation,
    const payee_index_t payee_index,
    const funds_transfer_t& transfer,
    address_t& destination) {
  if (payee_index >= released_.size() || !registry.contains(payee_index)) {
    return make_error(error_code::bad_payee_index, kEquityCodespace,
                      "bad payee index", std::to_string(payee_index));
  }
  if (registry.shares_of(payee_index).value() == 0) {
    return make_error(error_code::zero_shares, kEquityCodespace,
                      "payee has no shares", std::to_string(payee_index));
  }

  auto amount = owed(registry, payee_index);
  if (amount == 0) {
    return make_error(error_code::nothing_due, kEquityCodespace,
                      "payee is not due payment", std::to_string(payee_index));
  }

  auto enabled = rotation.enabled_address(registry, payee_index);
  if (!enabled.has_value()) {
    return make_error(error_code::bad_payee_index, kEquityCodespace,
                      "bad payee index", std::to_string(payee_index));
  }
  destination = enabled.value();

  released_[payee_index] += amount;
  total_released_ += amount;
  held_ -= amount;

  // Undo by delta so nested operations run from the transfer stay intact.
  auto rollback = [&] {
    released_[payee_index] -= amount;
    total_released_ -= amount;
    held_ += amount;
  };

  auto accepted = false;
  auto failure = std::string{};
  try {
    accepted = transfer(destination, amount);
  } catch (const std::exception& ex) {
    failure = ex.what();
  } catch (...) {
    rollback();
    throw;
  }
  if (!accepted) {
    rollback();
    return make_error(error_code::transfer_rejected, kEquityCodespace,
                      "transfer rejected by destination",
                      failure.empty() ? to_string(destination) : failure);
  }

  auto result = operation_result_t{};
  auto word = to_word(amount);
  result.data = bytes_t{std::begin(word), std::end(word)};
  return result;
}

std::optional<amount_t> payment_distributor::releasable(
    const share_registry& registry,
    const payee_index_t payee_index) const {
  if (payee_index >= released_.size() || !registry.contains(payee_index)) {
    return std::nullopt;
  }
  return owed(registry, payee_index);
}

std::optional<amount_t> payment_distributor::released(
    const payee_index_t payee_index) const {
  if (payee_index >= released_.size()) {
    return std::nullopt;
  }
  return released_[payee_index];
}

const amount_t& payment_distributor::held() const {
  return held_;
}

const amount_t& payment_distributor::total_released() const {
  return total_released_;
}

amount_t payment_distributor::total_received() const {
  return held_ + total_released_;
}

bool payment_distributor::restore(const amount_t& held,
                                  const amount_t& total_released,
                                  std::vector<amount_t> released) {
  if (released.size() != released_.size()) {
    return false;
  }
  auto sum = std::accumulate(std::begin(released), std::end(released),
                             wide_amount_t{},
                             [](const wide_amount_t& acc, const amount_t& v) {
                               return wide_amount_t{acc + wide_amount_t{v}};
                             });
  if (sum != wide_amount_t{total_released} ||
      wide_amount_t{held} + wide_amount_t{total_released} >
          wide_amount_t{(std::numeric_limits<amount_t>::max)()}) {
    return false;
  }
  held_ = held;
  total_released_ = total_released;
  released_ = std::move(released);
  return true;
}

amount_t payment_distributor::owed(const share_registry& registry,
                                   const payee_index_t payee_index) const {
  auto shares = registry.shares_of(payee_index);
  if (!shares.has_value() || registry.total_shares() == 0) {
    return amount_t{};
  }
  const auto entitled =
      wide_amount_t{wide_amount_t{total_received()} * wide_amount_t{*shares} /
                    wide_amount_t{registry.total_shares()}};
  auto paid = wide_amount_t{released_[payee_index]};
  if (entitled <= paid) {
    return amount_t{};
  }
  return static_cast<amount_t>(entitled - paid);
}

}  // namespace equimint::equity
