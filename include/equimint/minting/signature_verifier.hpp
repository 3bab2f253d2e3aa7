#pragma once

#include <equimint/crypto/recover.hpp>
#include <equimint/schema/primitives.hpp>
#include <equimint/schema/signing_domain.hpp>
#include <equimint/schema/voucher.hpp>
#include <optional>
#include <string_view>

namespace equimint::minting {

inline constexpr auto kDomainTypeString = std::string_view{
    "EIP712Domain(string name,string version,uint256 chainId,address "
    "verifyingContract)"};
inline constexpr auto kVoucherTypeString = std::string_view{
    "Voucher(uint256 assetId,uint256 minPrice,string metadataRef)"};

/// Hash binding every voucher signature to one issuer, version, network and
/// verifying contract.
equimint::schema::hash32_t domain_separator(
    const equimint::schema::signing_domain_t& domain);

/// Hash of the voucher payload fields. The signature is not part of it.
equimint::schema::hash32_t voucher_struct_hash(
    const equimint::schema::voucher_t& voucher);

/// Digest an authority signs: H(0x19 0x01 || separator || struct hash).
equimint::schema::hash32_t voucher_digest(
    const equimint::schema::signing_domain_t& domain,
    const equimint::schema::voucher_t& voucher);

std::optional<equimint::schema::address_t> recover_signer(
    const equimint::schema::signing_domain_t& domain,
    const equimint::schema::voucher_t& voucher,
    equimint::crypto::recover_error& error);

}  // namespace equimint::minting
