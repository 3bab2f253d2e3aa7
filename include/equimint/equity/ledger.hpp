#pragma once

#include <equimint/equity/address_rotation.hpp>
#include <equimint/equity/funds_transfer.hpp>
#include <equimint/equity/payment_distributor.hpp>
#include <equimint/equity/share_registry.hpp>
#include <equimint/schema/encoding/scale/encoder.hpp>
#include <equimint/schema/event.hpp>
#include <equimint/schema/operation_result.hpp>
#include <equimint/schema/payee.hpp>
#include <equimint/schema/primitives.hpp>
#include <equimint/storage/rocksdb/storage.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace equimint::equity {

/// Serialized equity accounting instance.
///
/// Owns the share registry, the address rotation cursors and the payment
/// distributor, journals their events and persists every successful mutation
/// as one RocksDB write batch. All public calls, reads included, take the
/// instance mutex. The mutex is recursive: a funds transfer that calls back
/// into `release` sees the already-updated accounting.
class ledger final {
 public:
  /// Validate and persist a new payee configuration. Returns nullptr and
  /// fills `result` when validation fails or a configuration already exists.
  static std::unique_ptr<ledger> create(
      equimint::schema::encoding::scale_encoder_t& encoder,
      equimint::storage::rocksdb_storage_t& storage,
      std::vector<equimint::schema::payee_addresses_t> groups,
      std::vector<equimint::schema::shares_t> shares,
      uint32_t group_size,
      equimint::schema::operation_result_t& result);

  /// Reload a persisted configuration, or nullptr when none exists.
  static std::unique_ptr<ledger> open(
      equimint::schema::encoding::scale_encoder_t& encoder,
      equimint::storage::rocksdb_storage_t& storage);

  ledger(const ledger&) = delete;
  ledger& operator=(const ledger&) = delete;

  /// Install the funds transfer hook; an empty function restores the default,
  /// which accepts every transfer.
  void set_funds_transfer(funds_transfer_t transfer);

  equimint::schema::operation_result_t receive(
      const equimint::schema::address_t& sender,
      const equimint::schema::amount_t& amount);

  /// Enable the next backup address of `payee_index`.
  equimint::schema::operation_result_t use_next_address(
      const equimint::schema::address_t& caller,
      equimint::schema::payee_index_t payee_index);

  /// Pay `payee_index` everything it is owed, at its enabled address.
  equimint::schema::operation_result_t release(
      equimint::schema::payee_index_t payee_index);

  std::size_t payee_count() const;
  uint32_t group_size() const;
  equimint::schema::shares_t total_shares() const;
  equimint::schema::amount_t total_released() const;
  equimint::schema::amount_t total_received() const;
  equimint::schema::amount_t held() const;

  std::optional<equimint::schema::shares_t> shares(
      equimint::schema::payee_index_t payee_index) const;
  std::optional<equimint::schema::amount_t> released(
      equimint::schema::payee_index_t payee_index) const;
  std::optional<equimint::schema::amount_t> releasable(
      equimint::schema::payee_index_t payee_index) const;
  std::optional<equimint::schema::payee_addresses_t> payee_addresses(
      equimint::schema::payee_index_t payee_index) const;
  std::optional<uint32_t> enabled_index(
      equimint::schema::payee_index_t payee_index) const;
  std::optional<equimint::schema::address_t> enabled_address(
      equimint::schema::payee_index_t payee_index) const;
  std::optional<equimint::schema::payee_t> payee(
      equimint::schema::payee_index_t payee_index) const;

  std::vector<equimint::schema::event_t> events() const;

 private:
  ledger(equimint::schema::encoding::scale_encoder_t& encoder,
         equimint::storage::rocksdb_storage_t& storage,
         share_registry registry);

  equimint::schema::event_t make_event(
      const char* type,
      std::vector<equimint::schema::event_attribute_t> attributes);
  equimint::storage::key_value_entry_t make_payee_entry(
      equimint::schema::payee_index_t payee_index) const;
  equimint::storage::key_value_entry_t make_totals_entry() const;
  void commit(std::vector<equimint::storage::key_value_entry_t> entries,
              const std::vector<equimint::schema::event_t>& events);
  void load_persisted_state();

  mutable std::recursive_mutex mutex_;
  equimint::schema::encoding::scale_encoder_t& encoder_;
  equimint::storage::rocksdb_storage_t& storage_;
  share_registry registry_;
  address_rotation rotation_;
  payment_distributor distributor_;
  funds_transfer_t transfer_;
  std::vector<equimint::schema::event_t> events_;
  uint64_t next_event_sequence_{1};
  uint64_t commit_count_{};
};

}  // namespace equimint::equity
