#include <spdlog/spdlog.h>
#include <equimint/minting/asset_registry.hpp>
#include <equimint/schema/key/keys.hpp>
#include <utility>

namespace equimint::minting {

asset_registry::asset_registry(
    equimint::schema::encoding::scale_encoder_t& encoder,
    equimint::storage::rocksdb_storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

equimint::schema::operation_result_t asset_registry::stage_issue(
    const equimint::schema::address_t& owner,
    const equimint::schema::asset_id_t& asset_id,
    const std::string& metadata_ref,
    std::vector<equimint::storage::key_value_entry_t>& entries) const {
  auto lock = std::scoped_lock{mutex_};
  if (equimint::schema::is_zero(owner)) {
    return equimint::schema::make_error(
        equimint::schema::error_code::zero_address,
        equimint::schema::kMintCodespace, "mint to the zero address");
  }
  auto key = equimint::schema::key::make_asset_owner_key(asset_id);
  if (storage_.get<equimint::schema::address_t>(encoder_, key).has_value()) {
    return equimint::schema::make_error(
        equimint::schema::error_code::duplicate_asset_id,
        equimint::schema::kMintCodespace, "asset already issued",
        asset_id.str());
  }
  entries.emplace_back(std::move(key), encoder_.encode(owner));
  entries.emplace_back(
      equimint::schema::key::make_asset_metadata_key(asset_id),
      encoder_.encode(metadata_ref));
  spdlog::debug("Staged asset {} for {}", asset_id.str(),
                equimint::schema::to_string(owner));
  return equimint::schema::operation_result_t{};
}

std::optional<equimint::schema::address_t> asset_registry::owner_of(
    const equimint::schema::asset_id_t& asset_id) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<equimint::schema::address_t>(
      encoder_, equimint::schema::key::make_asset_owner_key(asset_id));
}

std::optional<std::string> asset_registry::metadata_of(
    const equimint::schema::asset_id_t& asset_id) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<std::string>(
      encoder_, equimint::schema::key::make_asset_metadata_key(asset_id));
}

}  // namespace equimint::minting
