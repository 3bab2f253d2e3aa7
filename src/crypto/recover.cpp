#include <equimint/blake3/hash.hpp>
#include <equimint/crypto/recover.hpp>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <memory>

namespace equimint::crypto {

namespace {

using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;

ec_group_ptr make_group() {
  return ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                      EC_GROUP_free};
}

bignum_ptr make_bignum(const uint8_t* data, const int size) {
  return bignum_ptr{BN_bin2bn(data, size, nullptr), BN_free};
}

bignum_ptr make_bignum() {
  return bignum_ptr{BN_new(), BN_free};
}

}  // namespace

std::string_view to_string(const recover_error error) {
  switch (error) {
    case recover_error::none:
      return "none";
    case recover_error::invalid_length:
      return "invalid signature length";
    case recover_error::invalid_recovery_id:
      return "invalid signature 'v' value";
    case recover_error::invalid_s:
      return "invalid signature 's' value";
    case recover_error::invalid_r:
      return "invalid signature 'r' value";
    case recover_error::no_point:
      return "signature does not recover a curve point";
  }
  return "unknown";
}

bool available() {
  static const auto available_now = static_cast<bool>(make_group());
  return available_now;
}

std::optional<public_key_t> recover_public_key(
    const equimint::schema::hash32_t& digest,
    const equimint::schema::bytes_view_t& signature,
    recover_error& error) {
  error = recover_error::none;
  if (signature.size() != kSignatureSize) {
    error = recover_error::invalid_length;
    return std::nullopt;
  }

  auto v = signature[64];
  auto recovery_id = v >= 27 ? v - 27 : v;
  if (recovery_id > 1) {
    error = recover_error::invalid_recovery_id;
    return std::nullopt;
  }

  auto group = make_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  if (!group || !ctx) {
    error = recover_error::no_point;
    return std::nullopt;
  }

  const auto* order = EC_GROUP_get0_order(group.get());
  auto field = make_bignum();
  auto r = make_bignum(signature.data(), 32);
  auto s = make_bignum(signature.data() + 32, 32);
  auto half_order = make_bignum();
  if (!field || !r || !s || !half_order ||
      EC_GROUP_get_curve(group.get(), field.get(), nullptr, nullptr,
                         ctx.get()) != 1 ||
      BN_rshift1(half_order.get(), order) != 1) {
    error = recover_error::no_point;
    return std::nullopt;
  }

  if (BN_is_zero(r.get()) || BN_cmp(r.get(), order) >= 0 ||
      BN_cmp(r.get(), field.get()) >= 0) {
    error = recover_error::invalid_r;
    return std::nullopt;
  }
  // High-s signatures are malleable twins of a low-s signature.
  if (BN_is_zero(s.get()) || BN_cmp(s.get(), half_order.get()) > 0) {
    error = recover_error::invalid_s;
    return std::nullopt;
  }

  auto point_r = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point_r ||
      EC_POINT_set_compressed_coordinates(group.get(), point_r.get(), r.get(),
                                          recovery_id & 1, ctx.get()) != 1) {
    error = recover_error::no_point;
    return std::nullopt;
  }

  // Q = r^-1 * (s * R - e * G)
  auto e = make_bignum(digest.data(), static_cast<int>(digest.size()));
  auto r_inverse = bignum_ptr{
      BN_mod_inverse(nullptr, r.get(), order, ctx.get()), BN_free};
  auto zero = make_bignum();
  auto scaled_e = make_bignum();
  auto u1 = make_bignum();
  auto u2 = make_bignum();
  if (!e || !r_inverse || !zero || !scaled_e || !u1 || !u2) {
    error = recover_error::no_point;
    return std::nullopt;
  }
  BN_zero(zero.get());
  if (BN_mod_mul(scaled_e.get(), e.get(), r_inverse.get(), order, ctx.get()) !=
          1 ||
      BN_mod_sub(u1.get(), zero.get(), scaled_e.get(), order, ctx.get()) !=
          1 ||
      BN_mod_mul(u2.get(), s.get(), r_inverse.get(), order, ctx.get()) != 1) {
    error = recover_error::no_point;
    return std::nullopt;
  }

  auto point_q = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point_q ||
      EC_POINT_mul(group.get(), point_q.get(), u1.get(), point_r.get(),
                   u2.get(), ctx.get()) != 1 ||
      EC_POINT_is_at_infinity(group.get(), point_q.get()) == 1) {
    error = recover_error::no_point;
    return std::nullopt;
  }

  auto encoded = std::array<uint8_t, 65>{};
  auto written = EC_POINT_point2oct(group.get(), point_q.get(),
                                    POINT_CONVERSION_UNCOMPRESSED,
                                    encoded.data(), encoded.size(), ctx.get());
  if (written != encoded.size()) {
    error = recover_error::no_point;
    return std::nullopt;
  }

  auto public_key = public_key_t{};
  std::copy(std::begin(encoded) + 1, std::end(encoded),
            std::begin(public_key));
  return public_key;
}

std::optional<equimint::schema::address_t> recover_address(
    const equimint::schema::hash32_t& digest,
    const equimint::schema::bytes_view_t& signature,
    recover_error& error) {
  auto public_key = recover_public_key(digest, signature, error);
  if (!public_key.has_value()) {
    return std::nullopt;
  }
  return make_address(public_key.value());
}

equimint::schema::address_t make_address(const public_key_t& public_key) {
  auto digest = equimint::blake3::hash(
      equimint::schema::bytes_view_t{public_key.data(), public_key.size()});
  auto address = equimint::schema::address_t{};
  std::copy(std::end(digest) - static_cast<std::ptrdiff_t>(address.size()),
            std::end(digest), std::begin(address));
  return address;
}

}  // namespace equimint::crypto
