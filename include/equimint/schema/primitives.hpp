#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace equimint::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using amount_t = boost::multiprecision::uint256_t;
using asset_id_t = boost::multiprecision::uint256_t;
using shares_t = boost::multiprecision::uint256_t;
using payee_index_t = uint32_t;

/// 32-byte big-endian machine word used by typed hashing and persistence.
using word_t = hash32_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& bytes);
hash32_t make_zero_hash();

address_t make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_zero_address();
bool is_zero(const address_t& address);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

/// `0x`-prefixed lowercase hex, the display form of addresses and hashes.
std::string to_string(const address_t& address);
std::string to_string(const hash32_t& hash);

word_t to_word(const boost::multiprecision::uint256_t& value);
word_t to_word(const address_t& address);
boost::multiprecision::uint256_t from_word(const word_t& word);

/// Parse a decimal (or `0x` hex) unsigned integer that fits in 256 bits.
std::optional<boost::multiprecision::uint256_t> try_parse_uint256(
    std::string_view text);

}  // namespace equimint::schema
