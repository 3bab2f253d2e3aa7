#pragma once

#include <equimint/minting/asset_registry.hpp>
#include <equimint/minting/voucher_ledger.hpp>
#include <equimint/schema/encoding/scale/encoder.hpp>
#include <equimint/schema/event.hpp>
#include <equimint/schema/operation_result.hpp>
#include <equimint/schema/primitives.hpp>
#include <equimint/schema/signing_domain.hpp>
#include <equimint/schema/voucher.hpp>
#include <equimint/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace equimint::minting {

/// Returns the address whose signatures may authorize asset creation.
using authority_lookup_t = std::function<equimint::schema::address_t()>;

/// Signature-gated, replay-proof asset issuance.
///
/// A redemption is checked in a fixed order (signature format, signer,
/// payment, metadata reuse, asset identifier) and the first failing check
/// aborts without touching state. Every public call runs under one mutex.
class mint_authority final {
 public:
  /// Reloads redeemed metadata hashes, proceeds and the event journal from
  /// storage.
  mint_authority(equimint::schema::encoding::scale_encoder_t& encoder,
                 equimint::storage::rocksdb_storage_t& storage,
                 asset_registry& assets,
                 equimint::schema::signing_domain_t domain,
                 authority_lookup_t authority);

  /// Create `voucher.asset_id` for `requester` when the voucher carries a
  /// valid authority signature and `payment` covers its minimum price.
  ///
  /// On success the result data holds the asset identifier as a 32-byte
  /// big-endian word.
  equimint::schema::operation_result_t redeem(
      const equimint::schema::address_t& requester,
      const equimint::schema::voucher_t& voucher,
      const equimint::schema::amount_t& payment);

  /// Digest an authority must sign for `voucher` under this domain.
  equimint::schema::hash32_t digest(
      const equimint::schema::voucher_t& voucher) const;

  bool is_redeemed(std::string_view metadata_ref) const;

  std::optional<equimint::schema::asset_id_t> redeemed_asset(
      std::string_view metadata_ref) const;

  /// Sum of all accepted redemption payments.
  equimint::schema::amount_t proceeds() const;

  const equimint::schema::signing_domain_t& domain() const;

  std::vector<equimint::schema::event_t> events() const;

 private:
  void load_persisted_state();

  mutable std::mutex mutex_;
  equimint::schema::encoding::scale_encoder_t& encoder_;
  equimint::storage::rocksdb_storage_t& storage_;
  asset_registry& assets_;
  equimint::schema::signing_domain_t domain_;
  authority_lookup_t authority_;
  voucher_ledger ledger_;
  equimint::schema::amount_t proceeds_{};
  std::vector<equimint::schema::event_t> events_;
  uint64_t next_event_sequence_{1};
};

}  // namespace equimint::minting
