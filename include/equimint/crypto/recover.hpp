#pragma once

#include <equimint/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace equimint::crypto {

/// Uncompressed secp256k1 point without the 0x04 tag: X || Y.
using public_key_t = std::array<uint8_t, 64>;

inline constexpr auto kSignatureSize = std::size_t{65};

enum class recover_error : uint8_t {
  none = 0,
  invalid_length = 1,
  invalid_recovery_id = 2,
  invalid_s = 3,
  invalid_r = 4,
  no_point = 5
};

std::string_view to_string(recover_error error);

bool available();

/// Recover the signer public key from a 65-byte r || s || v signature over a
/// 32-byte digest. Only low-s signatures with v in {0, 1, 27, 28} recover.
std::optional<public_key_t> recover_public_key(
    const equimint::schema::hash32_t& digest,
    const equimint::schema::bytes_view_t& signature,
    recover_error& error);

std::optional<equimint::schema::address_t> recover_address(
    const equimint::schema::hash32_t& digest,
    const equimint::schema::bytes_view_t& signature,
    recover_error& error);

/// Last 20 bytes of the hash of X || Y.
equimint::schema::address_t make_address(const public_key_t& public_key);

}  // namespace equimint::crypto
