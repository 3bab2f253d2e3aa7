#pragma once
#include <equimint/schema/primitives.hpp>
#include <string>

// Schema type: signing domain.
// Binds voucher signatures to one issuer, protocol version, network and
// verifying contract so they cannot be replayed against another instance.
namespace equimint::schema {

template <uint16_t Version>
struct signing_domain;

template <>
struct signing_domain<1> final {
  uint16_t version{1};
  std::string name;
  std::string domain_version{"1"};
  amount_t chain_id{};
  address_t verifying_contract{};
};

using signing_domain_t = signing_domain<1>;

}  // namespace equimint::schema
