#include <equimint/minting/voucher_ledger.hpp>

namespace equimint::minting {

bool voucher_ledger::contains(
    const equimint::schema::hash32_t& metadata_hash) const {
  return used_.contains(metadata_hash);
}

bool voucher_ledger::mark(const equimint::schema::hash32_t& metadata_hash,
                          const equimint::schema::asset_id_t& asset_id) {
  return used_.try_emplace(metadata_hash, asset_id).second;
}

std::optional<equimint::schema::asset_id_t> voucher_ledger::asset_of(
    const equimint::schema::hash32_t& metadata_hash) const {
  auto it = used_.find(metadata_hash);
  if (it == std::end(used_)) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t voucher_ledger::size() const {
  return used_.size();
}

}  // namespace equimint::minting
