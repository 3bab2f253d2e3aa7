#pragma once

#include <equimint/schema/encoding/scale/encoder.hpp>
#include <equimint/schema/operation_result.hpp>
#include <equimint/schema/primitives.hpp>
#include <equimint/storage/rocksdb/storage.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace equimint::minting {

/// Unique-asset bookkeeping backed by RocksDB: one owner row per issued asset
/// identifier and an optional metadata reference bound to it.
class asset_registry final {
 public:
  asset_registry(equimint::schema::encoding::scale_encoder_t& encoder,
                 equimint::storage::rocksdb_storage_t& storage);

  /// Appends the owner and metadata rows for a new asset to `entries` without
  /// writing them. The caller commits them in the same batch as its own rows.
  /// Fails with `zero_address` for the null owner and `duplicate_asset_id`
  /// when the identifier was issued before; `entries` is untouched on failure.
  equimint::schema::operation_result_t stage_issue(
      const equimint::schema::address_t& owner,
      const equimint::schema::asset_id_t& asset_id,
      const std::string& metadata_ref,
      std::vector<equimint::storage::key_value_entry_t>& entries) const;

  std::optional<equimint::schema::address_t> owner_of(
      const equimint::schema::asset_id_t& asset_id) const;

  std::optional<std::string> metadata_of(
      const equimint::schema::asset_id_t& asset_id) const;

 private:
  mutable std::mutex mutex_;
  equimint::schema::encoding::scale_encoder_t& encoder_;
  equimint::storage::rocksdb_storage_t& storage_;
};

}  // namespace equimint::minting
