#pragma once

#include <equimint/schema/primitives.hpp>
#include <cstddef>
#include <map>
#include <optional>

namespace equimint::minting {

/// Record of redeemed metadata references, keyed by the hash of the
/// reference. Entries are never removed or updated. Not synchronized on its
/// own: the owning mint authority serializes access.
class voucher_ledger final {
 public:
  bool contains(const equimint::schema::hash32_t& metadata_hash) const;

  /// Returns false, and changes nothing, if the hash is already recorded.
  bool mark(const equimint::schema::hash32_t& metadata_hash,
            const equimint::schema::asset_id_t& asset_id);

  std::optional<equimint::schema::asset_id_t> asset_of(
      const equimint::schema::hash32_t& metadata_hash) const;

  std::size_t size() const;

 private:
  std::map<equimint::schema::hash32_t, equimint::schema::asset_id_t> used_;
};

}  // namespace equimint::minting
