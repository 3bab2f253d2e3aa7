#pragma once

#include <equimint/crypto/recover.hpp>
#include <equimint/schema/primitives.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <optional>

namespace equimint::testing {

namespace detail {

using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using param_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

inline ec_group_ptr make_group() {
  return ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                      EC_GROUP_free};
}

}  // namespace detail

/// secp256k1 key pair with a small, fixed private scalar. Signs 32-byte
/// digests into the 65-byte r || s || v form, normalized to low s.
class test_signer final {
 public:
  explicit test_signer(const uint64_t secret) : secret_{secret} {
    auto group = detail::make_group();
    auto ctx = detail::bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
    auto priv = detail::bignum_ptr{BN_new(), BN_free};
    if (!group || !ctx || !priv || BN_set_word(priv.get(), secret) != 1) {
      return;
    }
    auto point = detail::ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
    if (!point || EC_POINT_mul(group.get(), point.get(), priv.get(), nullptr,
                               nullptr, ctx.get()) != 1) {
      return;
    }
    if (EC_POINT_point2oct(group.get(), point.get(),
                           POINT_CONVERSION_UNCOMPRESSED, encoded_.data(),
                           encoded_.size(),
                           ctx.get()) != encoded_.size()) {
      return;
    }
    std::copy(std::begin(encoded_) + 1, std::end(encoded_),
              std::begin(public_key_));
    address_ = equimint::crypto::make_address(public_key_);
    valid_ = true;
  }

  bool valid() const { return valid_; }
  const equimint::crypto::public_key_t& public_key() const {
    return public_key_;
  }
  const equimint::schema::address_t& address() const { return address_; }

  std::optional<equimint::schema::bytes_t> sign(
      const equimint::schema::hash32_t& digest) const {
    if (!valid_) {
      return std::nullopt;
    }
    auto pkey = make_pkey();
    if (!pkey) {
      return std::nullopt;
    }
    auto sign_ctx = detail::evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr),
        EVP_PKEY_CTX_free};
    auto der_size = std::size_t{};
    if (!sign_ctx || EVP_PKEY_sign_init(sign_ctx.get()) != 1 ||
        EVP_PKEY_sign(sign_ctx.get(), nullptr, &der_size, digest.data(),
                      digest.size()) != 1) {
      return std::nullopt;
    }
    auto der = equimint::schema::bytes_t(der_size);
    if (EVP_PKEY_sign(sign_ctx.get(), der.data(), &der_size, digest.data(),
                      digest.size()) != 1) {
      return std::nullopt;
    }
    const auto* der_ptr = der.data();
    auto signature = detail::ecdsa_sig_ptr{
        d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
        ECDSA_SIG_free};
    if (!signature) {
      return std::nullopt;
    }
    const auto* r = ECDSA_SIG_get0_r(signature.get());
    const auto* s = ECDSA_SIG_get0_s(signature.get());

    auto group = detail::make_group();
    auto low_s = detail::bignum_ptr{BN_dup(s), BN_free};
    auto half_order = detail::bignum_ptr{BN_new(), BN_free};
    if (!group || !low_s || !half_order) {
      return std::nullopt;
    }
    const auto* order = EC_GROUP_get0_order(group.get());
    if (BN_rshift1(half_order.get(), order) != 1) {
      return std::nullopt;
    }
    if (BN_cmp(low_s.get(), half_order.get()) > 0 &&
        BN_sub(low_s.get(), order, s) != 1) {
      return std::nullopt;
    }

    auto out = equimint::schema::bytes_t(equimint::crypto::kSignatureSize);
    if (BN_bn2binpad(r, out.data(), 32) != 32 ||
        BN_bn2binpad(low_s.get(), out.data() + 32, 32) != 32) {
      return std::nullopt;
    }
    for (uint8_t recovery_id = 0; recovery_id < 2; ++recovery_id) {
      out[64] = static_cast<uint8_t>(27 + recovery_id);
      auto error = equimint::crypto::recover_error::none;
      auto recovered = equimint::crypto::recover_address(
          digest, equimint::schema::make_bytes_view(out), error);
      if (recovered.has_value() && recovered.value() == address_) {
        return out;
      }
    }
    return std::nullopt;
  }

 private:
  detail::evp_pkey_ptr make_pkey() const {
    auto none = detail::evp_pkey_ptr{nullptr, EVP_PKEY_free};
    auto priv = detail::bignum_ptr{BN_new(), BN_free};
    auto builder =
        detail::param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
    if (!priv || !builder || BN_set_word(priv.get(), secret_) != 1 ||
        OSSL_PARAM_BLD_push_utf8_string(builder.get(),
                                        OSSL_PKEY_PARAM_GROUP_NAME,
                                        "secp256k1", 0) != 1 ||
        OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                               priv.get()) != 1 ||
        OSSL_PARAM_BLD_push_octet_string(builder.get(),
                                         OSSL_PKEY_PARAM_PUB_KEY,
                                         encoded_.data(),
                                         encoded_.size()) != 1) {
      return none;
    }
    auto params = detail::param_ptr{OSSL_PARAM_BLD_to_param(builder.get()),
                                    OSSL_PARAM_free};
    auto ctx = detail::evp_pkey_ctx_ptr{
        EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
    if (!params || !ctx || EVP_PKEY_fromdata_init(ctx.get()) != 1) {
      return none;
    }
    auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
    if (EVP_PKEY_fromdata(ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                          params.get()) != 1) {
      return none;
    }
    return detail::evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
  }

  uint64_t secret_{};
  bool valid_{};
  std::array<uint8_t, 65> encoded_{};
  equimint::crypto::public_key_t public_key_{};
  equimint::schema::address_t address_{};
};

/// Replace s with n - s and flip the recovery id: the malleable twin of a
/// valid signature.
inline equimint::schema::bytes_t make_high_s(
    const equimint::schema::bytes_t& signature) {
  auto out = signature;
  auto group = detail::make_group();
  auto s = detail::bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr),
                              BN_free};
  auto flipped = detail::bignum_ptr{BN_new(), BN_free};
  if (!group || !s || !flipped ||
      BN_sub(flipped.get(), EC_GROUP_get0_order(group.get()), s.get()) != 1 ||
      BN_bn2binpad(flipped.get(), out.data() + 32, 32) != 32) {
    return out;
  }
  out[64] = static_cast<uint8_t>(out[64] == 27 ? 28 : 27);
  return out;
}

}  // namespace equimint::testing
