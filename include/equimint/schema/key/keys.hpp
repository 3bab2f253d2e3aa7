#pragma once

#include <equimint/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: state keys.
// Canonical key prefixes and key codecs for equity accounting, redemption
// bookkeeping, the asset registry, and the per-instance event journals.
namespace equimint::schema::key {

inline constexpr std::string_view kEquityConfigKey{"EQ|CONFIG"};
inline constexpr std::string_view kEquityTotalsKey{"EQ|TOTALS"};
inline constexpr std::string_view kEquityPayeeKeyPrefix{"EQ|PAYEE|"};
inline constexpr std::string_view kEquityEventPrefix{"EQ|EVENT|"};
inline constexpr std::string_view kVoucherUsedKeyPrefix{"MNT|USED|"};
inline constexpr std::string_view kMintProceedsKey{"MNT|PROCEEDS"};
inline constexpr std::string_view kMintEventPrefix{"MNT|EVENT|"};
inline constexpr std::string_view kAssetOwnerKeyPrefix{"AST|OWNER|"};
inline constexpr std::string_view kAssetMetadataKeyPrefix{"AST|METADATA|"};

equimint::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const equimint::schema::bytes_t& id);

equimint::schema::bytes_t make_equity_config_key();
equimint::schema::bytes_t make_equity_totals_key();
equimint::schema::bytes_t make_payee_key(equimint::schema::payee_index_t index);
equimint::schema::bytes_t make_equity_event_key(uint64_t sequence);

equimint::schema::bytes_t make_voucher_used_key(
    const equimint::schema::hash32_t& metadata_hash);
equimint::schema::bytes_t make_mint_proceeds_key();
equimint::schema::bytes_t make_mint_event_key(uint64_t sequence);

equimint::schema::bytes_t make_asset_owner_key(
    const equimint::schema::asset_id_t& asset_id);
equimint::schema::bytes_t make_asset_metadata_key(
    const equimint::schema::asset_id_t& asset_id);

/// Recover the id suffix of a key written under `prefix`.
std::optional<equimint::schema::bytes_view_t> key_suffix(
    std::string_view prefix,
    const equimint::schema::bytes_view_t& key);

}  // namespace equimint::schema::key
