#include <equimint/schema/key/keys.hpp>

#include <equimint/schema/encoding/scale/encoder.hpp>

#include <algorithm>

namespace equimint::schema::key {

namespace {

using key_encoder_t = equimint::schema::encoding::scale_encoder_t;

equimint::schema::bytes_t make_word_bytes(
    const equimint::schema::word_t& word) {
  return equimint::schema::bytes_t{std::begin(word), std::end(word)};
}

}  // namespace

equimint::schema::bytes_t make_prefixed_key(
    std::string_view prefix,
    const equimint::schema::bytes_t& id) {
  auto key = equimint::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

equimint::schema::bytes_t make_equity_config_key() {
  return equimint::schema::make_bytes(kEquityConfigKey);
}

equimint::schema::bytes_t make_equity_totals_key() {
  return equimint::schema::make_bytes(kEquityTotalsKey);
}

equimint::schema::bytes_t make_payee_key(
    const equimint::schema::payee_index_t index) {
  return make_prefixed_key(kEquityPayeeKeyPrefix,
                           key_encoder_t{}.encode(index));
}

equimint::schema::bytes_t make_equity_event_key(const uint64_t sequence) {
  return make_prefixed_key(kEquityEventPrefix,
                           key_encoder_t{}.encode(sequence));
}

equimint::schema::bytes_t make_voucher_used_key(
    const equimint::schema::hash32_t& metadata_hash) {
  return make_prefixed_key(kVoucherUsedKeyPrefix,
                           make_word_bytes(metadata_hash));
}

equimint::schema::bytes_t make_mint_proceeds_key() {
  return equimint::schema::make_bytes(kMintProceedsKey);
}

equimint::schema::bytes_t make_mint_event_key(const uint64_t sequence) {
  return make_prefixed_key(kMintEventPrefix, key_encoder_t{}.encode(sequence));
}

equimint::schema::bytes_t make_asset_owner_key(
    const equimint::schema::asset_id_t& asset_id) {
  return make_prefixed_key(kAssetOwnerKeyPrefix,
                           make_word_bytes(equimint::schema::to_word(asset_id)));
}

equimint::schema::bytes_t make_asset_metadata_key(
    const equimint::schema::asset_id_t& asset_id) {
  return make_prefixed_key(kAssetMetadataKeyPrefix,
                           make_word_bytes(equimint::schema::to_word(asset_id)));
}

std::optional<equimint::schema::bytes_view_t> key_suffix(
    const std::string_view prefix,
    const equimint::schema::bytes_view_t& key) {
  if (key.size() < prefix.size()) {
    return std::nullopt;
  }
  auto head = equimint::schema::make_bytes_view(prefix);
  if (!std::equal(std::begin(head), std::end(head), std::begin(key))) {
    return std::nullopt;
  }
  return key.subspan(prefix.size());
}

}  // namespace equimint::schema::key
