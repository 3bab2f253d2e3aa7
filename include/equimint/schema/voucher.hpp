#pragma once
#include <equimint/schema/primitives.hpp>
#include <string>

// Schema type: voucher.
// Off-chain authorization to create one asset at a minimum price. Transient:
// exists only for the duration of a redemption request.
namespace equimint::schema {

template <uint16_t Version>
struct voucher;

template <>
struct voucher<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  amount_t min_price{};
  std::string metadata_ref;
  bytes_t signature;
};

using voucher_t = voucher<1>;

}  // namespace equimint::schema
