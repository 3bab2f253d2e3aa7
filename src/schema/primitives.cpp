#include <equimint/common/critical.hpp>
#include <equimint/schema/primitives.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <limits>
#include <string_view>

namespace equimint::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(decoded->begin(), decoded->end(), out.begin());
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string_view make_string_view(const bytes_view_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    equimint::common::critical("make_hash32 expected exactly 32 bytes");
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& bytes) {
  auto hash = try_make_fixed<32>(bytes);
  if (!hash) {
    equimint::common::critical("make_hash32 expected 64 hex characters");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& bytes) {
  return try_make_fixed<32>(bytes);
}

hash32_t make_zero_hash() {
  return {};
}

address_t make_address(const std::string_view& hex) {
  auto address = try_make_fixed<20>(hex);
  if (!address) {
    equimint::common::critical("make_address expected 40 hex characters");
  }
  return *address;
}

std::optional<address_t> try_make_address(const std::string_view& hex) {
  return try_make_fixed<20>(hex);
}

address_t make_zero_address() {
  return {};
}

bool is_zero(const address_t& address) {
  return std::all_of(std::begin(address), std::end(address),
                     [](const uint8_t byte) { return byte == 0; });
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded.has_value()) {
    equimint::common::critical("invalid hex input");
  }
  return *decoded;
}

std::string to_string(const address_t& address) {
  return "0x" + to_hex(bytes_view_t{address.data(), address.size()});
}

std::string to_string(const hash32_t& hash) {
  return "0x" + to_hex(bytes_view_t{hash.data(), hash.size()});
}

word_t to_word(const boost::multiprecision::uint256_t& value) {
  auto word = word_t{};
  auto bytes = bytes_t{};
  boost::multiprecision::export_bits(value, std::back_inserter(bytes), 8);
  // export_bits emits the minimal big-endian representation.
  std::copy(std::begin(bytes), std::end(bytes),
            std::begin(word) + static_cast<std::ptrdiff_t>(word.size() -
                                                           bytes.size()));
  return word;
}

word_t to_word(const address_t& address) {
  auto word = word_t{};
  std::copy(std::begin(address), std::end(address),
            std::begin(word) +
                static_cast<std::ptrdiff_t>(word.size() - address.size()));
  return word;
}

boost::multiprecision::uint256_t from_word(const word_t& word) {
  auto value = boost::multiprecision::uint256_t{};
  boost::multiprecision::import_bits(value, std::begin(word), std::end(word),
                                     8);
  return value;
}

std::optional<boost::multiprecision::uint256_t> try_parse_uint256(
    std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  auto is_hex = text.size() > 2 && text[0] == '0' &&
                (text[1] == 'x' || text[1] == 'X');
  auto digits = is_hex ? text.substr(2) : text;
  if (digits.empty()) {
    return std::nullopt;
  }
  auto valid = std::all_of(std::begin(digits), std::end(digits), [&](char c) {
    return is_hex ? hex_nibble(c).has_value()
                  : std::isdigit(static_cast<unsigned char>(c)) != 0;
  });
  if (!valid) {
    return std::nullopt;
  }

  const auto base = is_hex ? 16u : 10u;
  const auto limit = boost::multiprecision::cpp_int{
      (std::numeric_limits<boost::multiprecision::uint256_t>::max)()};
  auto wide = boost::multiprecision::cpp_int{};
  for (const auto c : digits) {
    wide = (wide * base) + *hex_nibble(c);
    if (wide > limit) {
      return std::nullopt;
    }
  }
  return static_cast<boost::multiprecision::uint256_t>(wide);
}

}  // namespace equimint::schema
