#include <equimint/blake3/hash.hpp>
#include <equimint/minting/signature_verifier.hpp>

#include <array>

namespace equimint::minting {

namespace {

using equimint::schema::bytes_view_t;

bytes_view_t view(const equimint::schema::word_t& word) {
  return bytes_view_t{word.data(), word.size()};
}

}  // namespace

equimint::schema::hash32_t domain_separator(
    const equimint::schema::signing_domain_t& domain) {
  auto type_hash = equimint::blake3::hash(kDomainTypeString);
  auto name_hash = equimint::blake3::hash(std::string_view{domain.name});
  auto version_hash =
      equimint::blake3::hash(std::string_view{domain.domain_version});
  auto chain_id = equimint::schema::to_word(domain.chain_id);
  auto contract = equimint::schema::to_word(domain.verifying_contract);
  return equimint::blake3::hash({view(type_hash), view(name_hash),
                                 view(version_hash), view(chain_id),
                                 view(contract)});
}

equimint::schema::hash32_t voucher_struct_hash(
    const equimint::schema::voucher_t& voucher) {
  auto type_hash = equimint::blake3::hash(kVoucherTypeString);
  auto asset_id = equimint::schema::to_word(voucher.asset_id);
  auto min_price = equimint::schema::to_word(voucher.min_price);
  auto metadata_hash =
      equimint::blake3::hash(std::string_view{voucher.metadata_ref});
  return equimint::blake3::hash({view(type_hash), view(asset_id),
                                 view(min_price), view(metadata_hash)});
}

equimint::schema::hash32_t voucher_digest(
    const equimint::schema::signing_domain_t& domain,
    const equimint::schema::voucher_t& voucher) {
  static constexpr auto kPrefix = std::array<uint8_t, 2>{0x19, 0x01};
  auto separator = domain_separator(domain);
  auto struct_hash = voucher_struct_hash(voucher);
  return equimint::blake3::hash({bytes_view_t{kPrefix.data(), kPrefix.size()},
                                 view(separator), view(struct_hash)});
}

std::optional<equimint::schema::address_t> recover_signer(
    const equimint::schema::signing_domain_t& domain,
    const equimint::schema::voucher_t& voucher,
    equimint::crypto::recover_error& error) {
  return equimint::crypto::recover_address(
      voucher_digest(domain, voucher),
      equimint::schema::make_bytes_view(voucher.signature), error);
}

}  // namespace equimint::minting
