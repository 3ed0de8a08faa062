#include <gtest/gtest.h>
#include <veritas/schema/chain_error_code.hpp>
#include <veritas/schema/primitives.hpp>
#include <veritas/schema/verification_verdict.hpp>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = veritas::schema::bytes_t(32, 0xAB);
  auto hash = veritas::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = veritas::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_hash32_rejects_wrong_length) {
  auto short_bytes = veritas::schema::bytes_t(31, 0x01);
  EXPECT_FALSE(veritas::schema::try_make_hash32(
                   veritas::schema::make_bytes_view(short_bytes))
                   .has_value());
  EXPECT_FALSE(
      veritas::schema::try_make_hash32(std::string_view{"0102"}).has_value());
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = veritas::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, hex_round_trips_bytes) {
  auto payload = veritas::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF};
  auto encoded = veritas::schema::to_hex(payload);
  EXPECT_EQ(encoded, "010203feff");
  EXPECT_EQ(veritas::schema::from_hex(encoded), payload);
  EXPECT_EQ(veritas::schema::from_hex("0x010203FEFF"), payload);
}

TEST(primitives, try_from_hex_rejects_invalid_input) {
  EXPECT_FALSE(veritas::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(veritas::schema::try_from_hex("zz").has_value());
}

TEST(primitives, try_make_public_key_requires_32_bytes) {
  EXPECT_TRUE(veritas::schema::try_make_public_key(std::string(64, 'a'))
                  .has_value());
  EXPECT_FALSE(veritas::schema::try_make_public_key(std::string(62, 'a'))
                   .has_value());
}

TEST(primitives, verdict_and_chain_error_names_are_stable) {
  using veritas::schema::chain_error_code;
  using veritas::schema::verification_verdict_t;
  EXPECT_EQ(veritas::schema::to_string(verification_verdict_t::not_found),
            "NOT_FOUND");
  EXPECT_EQ(
      veritas::schema::to_string(verification_verdict_t::verified_on_chain),
      "VERIFIED_ON_CHAIN");
  EXPECT_EQ(
      veritas::schema::to_string(verification_verdict_t::chain_unreachable),
      "CHAIN_UNREACHABLE");
  EXPECT_EQ(veritas::schema::to_string(chain_error_code::duplicate_entry),
            "duplicate_entry");
  EXPECT_TRUE(veritas::schema::is_transient(chain_error_code::timeout));
  EXPECT_TRUE(
      veritas::schema::is_transient(chain_error_code::network_unavailable));
  EXPECT_FALSE(
      veritas::schema::is_transient(chain_error_code::insufficient_funds));
  EXPECT_FALSE(
      veritas::schema::is_transient(chain_error_code::duplicate_entry));
}
