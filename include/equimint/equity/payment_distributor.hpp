#pragma once

#include <equimint/equity/address_rotation.hpp>
#include <equimint/equity/funds_transfer.hpp>
#include <equimint/equity/share_registry.hpp>
#include <equimint/schema/operation_result.hpp>
#include <equimint/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <vector>

namespace equimint::equity {

/// Pull-based proportional distribution of a held balance.
///
/// A payee is owed floor(total_received * shares / total_shares) minus what
/// it was already paid, where total_received = held + total_released.
/// Rounding dust stays in the held balance.
class payment_distributor final {
 public:
  explicit payment_distributor(std::size_t payee_count);

  /// Credit incoming value. Fails only if the total ever received would no
  /// longer fit 256 bits.
  equimint::schema::operation_result_t receive(
      const equimint::schema::amount_t& amount);

  /// Pay everything currently owed to the enabled address of `payee_index`.
  /// Accounting is updated before `transfer` runs and is restored if the
  /// destination refuses or `transfer` throws. A std::exception is reported
  /// as `transfer_rejected` with its message as info; anything else is
  /// rethrown after the restore. On success the result data holds the amount as a
  /// 32-byte word and the destination is reported through `destination`.
  equimint::schema::operation_result_t release(
      const share_registry& registry,
      const address_rotation& rotation,
      equimint::schema::payee_index_t payee_index,
      const funds_transfer_t& transfer,
      equimint::schema::address_t& destination);

  /// Amount `release` would pay right now, zero when nothing is due.
  std::optional<equimint::schema::amount_t> releasable(
      const share_registry& registry,
      equimint::schema::payee_index_t payee_index) const;

  std::optional<equimint::schema::amount_t> released(
      equimint::schema::payee_index_t payee_index) const;

  const equimint::schema::amount_t& held() const;
  const equimint::schema::amount_t& total_released() const;
  equimint::schema::amount_t total_received() const;

  /// Reinstate persisted accounting.
  bool restore(const equimint::schema::amount_t& held,
               const equimint::schema::amount_t& total_released,
               std::vector<equimint::schema::amount_t> released);

 private:
  equimint::schema::amount_t owed(
      const share_registry& registry,
      equimint::schema::payee_index_t payee_index) const;

  equimint::schema::amount_t held_{};
  equimint::schema::amount_t total_released_{};
  std::vector<equimint::schema::amount_t> released_;
};

}  // namespace equimint::equity
