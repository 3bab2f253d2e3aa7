#include <gtest/gtest.h>
#include <equimint/schema/error_code.hpp>
#include <equimint/schema/primitives.hpp>

#include <limits>
#include <string_view>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = equimint::schema::bytes_t(32, 0xAB);
  auto hash = equimint::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = equimint::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = equimint::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, address_parses_with_and_without_prefix) {
  auto with_prefix = equimint::schema::try_make_address(
      "0x00000000000000000000000000000000000000ff");
  auto without_prefix = equimint::schema::try_make_address(
      "00000000000000000000000000000000000000FF");
  ASSERT_TRUE(with_prefix.has_value());
  ASSERT_TRUE(without_prefix.has_value());
  EXPECT_EQ(with_prefix.value(), without_prefix.value());
  EXPECT_EQ(with_prefix->back(), 0xFF);
  EXPECT_FALSE(equimint::schema::is_zero(with_prefix.value()));
}

TEST(primitives, address_rejects_wrong_length_and_bad_digits) {
  EXPECT_FALSE(equimint::schema::try_make_address("0x1234").has_value());
  EXPECT_FALSE(equimint::schema::try_make_address(
                   "0xzz00000000000000000000000000000000000000")
                   .has_value());
  EXPECT_FALSE(equimint::schema::try_make_address(
                   "0x0000000000000000000000000000000000000000ff")
                   .has_value());
}

TEST(primitives, zero_address_is_zero) {
  EXPECT_TRUE(equimint::schema::is_zero(equimint::schema::make_zero_address()));
}

TEST(primitives, address_display_form_is_prefixed_lowercase_hex) {
  auto address = equimint::schema::make_address(
      "0xABCDEF0000000000000000000000000000000001");
  EXPECT_EQ(equimint::schema::to_string(address),
            "0xabcdef0000000000000000000000000000000001");
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = equimint::schema::bytes_t{0x00, 0x01, 0x7F, 0xFE, 0xFF};
  auto encoded = equimint::schema::to_hex(payload);
  EXPECT_EQ(encoded, "00017ffeff");
  EXPECT_EQ(equimint::schema::from_hex(encoded), payload);
  EXPECT_FALSE(equimint::schema::try_from_hex("abc").has_value());
}

TEST(primitives, words_are_big_endian_and_left_padded) {
  auto word =
      equimint::schema::to_word(equimint::schema::amount_t{0x0102});
  EXPECT_EQ(word[30], 0x01);
  EXPECT_EQ(word[31], 0x02);
  for (std::size_t i = 0; i < 30; ++i) {
    EXPECT_EQ(word[i], 0u);
  }
  EXPECT_EQ(equimint::schema::from_word(word), equimint::schema::amount_t{258});

  auto address = equimint::schema::make_address(
      "0x1111111111111111111111111111111111111111");
  auto address_word = equimint::schema::to_word(address);
  for (std::size_t i = 0; i < 12; ++i) {
    EXPECT_EQ(address_word[i], 0u);
  }
  EXPECT_EQ(address_word[12], 0x11);
  EXPECT_EQ(address_word[31], 0x11);
}

TEST(primitives, max_value_fills_the_word) {
  auto max = (std::numeric_limits<equimint::schema::amount_t>::max)();
  auto word = equimint::schema::to_word(max);
  for (auto byte : word) {
    EXPECT_EQ(byte, 0xFF);
  }
  EXPECT_EQ(equimint::schema::from_word(word), max);
}

TEST(primitives, parse_uint256_accepts_decimal_and_hex) {
  EXPECT_EQ(equimint::schema::try_parse_uint256("1337").value(),
            equimint::schema::amount_t{1337});
  EXPECT_EQ(equimint::schema::try_parse_uint256("0x539").value(),
            equimint::schema::amount_t{1337});
  EXPECT_EQ(equimint::schema::try_parse_uint256("0010").value(),
            equimint::schema::amount_t{10});
  EXPECT_EQ(equimint::schema::try_parse_uint256("0").value(),
            equimint::schema::amount_t{0});
}

TEST(primitives, parse_uint256_rejects_garbage_and_overflow) {
  EXPECT_FALSE(equimint::schema::try_parse_uint256("").has_value());
  EXPECT_FALSE(equimint::schema::try_parse_uint256("-1").has_value());
  EXPECT_FALSE(equimint::schema::try_parse_uint256("12a").has_value());
  EXPECT_FALSE(equimint::schema::try_parse_uint256("0x").has_value());
  // 2^256
  EXPECT_FALSE(equimint::schema::try_parse_uint256(
                   "115792089237316195423570985008687907853269984665640564039"
                   "457584007913129639936")
                   .has_value());
  EXPECT_TRUE(equimint::schema::try_parse_uint256(
                  "115792089237316195423570985008687907853269984665640564039"
                  "457584007913129639935")
                  .has_value());
}

TEST(error_code, names_round_trip) {
  EXPECT_EQ(equimint::schema::to_string(
                equimint::schema::error_code::self_rotation_forbidden),
            "self_rotation_forbidden");
  auto parsed = equimint::schema::try_from_string<equimint::schema::error_code>(
      "nothing_due");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed.value(), equimint::schema::error_code::nothing_due);
  EXPECT_FALSE(equimint::schema::try_from_string<equimint::schema::error_code>(
                   "no_such_error")
                   .has_value());
}
