#include <gtest/gtest.h>
#include <flowcap/schema/primitives.hpp>

#include <string>

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = flowcap::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, make_hash32_accepts_raw_32_byte_string) {
  auto raw = std::string(32, 'z');
  auto hash = flowcap::schema::make_hash32(raw);
  EXPECT_EQ(hash[0], static_cast<uint8_t>('z'));
  EXPECT_EQ(hash[31], static_cast<uint8_t>('z'));
}

TEST(primitives, try_make_hash32_rejects_bad_input) {
  EXPECT_FALSE(flowcap::schema::try_make_hash32(std::string{"abc"}));
  EXPECT_FALSE(flowcap::schema::try_make_hash32(std::string(64, 'g')));
  EXPECT_FALSE(flowcap::schema::try_make_hash32(std::string{"0x"} +
                                                std::string(32, 'a')));
}

TEST(primitives, to_hex_round_trips_hash) {
  auto text = std::string{
      "00112233445566778899aabbccddeeff"
      "00112233445566778899aabbccddeeff"};
  auto hash = flowcap::schema::make_hash32(text);
  EXPECT_EQ(flowcap::schema::to_hex(hash), text);
}

TEST(primitives, label_hash_is_zero_padded) {
  auto label = flowcap::schema::try_make_label_hash("USDC");
  ASSERT_TRUE(label.has_value());
  EXPECT_EQ((*label)[0], static_cast<uint8_t>('U'));
  EXPECT_EQ((*label)[3], static_cast<uint8_t>('C'));
  EXPECT_EQ((*label)[4], 0u);
  EXPECT_FALSE(flowcap::schema::try_make_label_hash(""));
  EXPECT_FALSE(flowcap::schema::try_make_label_hash(std::string(33, 'a')));
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = flowcap::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, amount_parses_full_256_bit_range) {
  auto max_text = flowcap::schema::to_string(flowcap::schema::max_amount());
  auto parsed = flowcap::schema::try_make_amount(max_text);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, flowcap::schema::max_amount());
  EXPECT_EQ(flowcap::schema::make_amount("1000000"),
            flowcap::schema::amount_t{1000000});
}

TEST(primitives, amount_rejects_overflow_and_non_digits) {
  auto max_text = flowcap::schema::to_string(flowcap::schema::max_amount());
  auto too_large = max_text;
  too_large.back() = static_cast<char>(too_large.back() + 1);
  EXPECT_FALSE(flowcap::schema::try_make_amount(too_large));
  EXPECT_FALSE(flowcap::schema::try_make_amount(max_text + "0"));
  EXPECT_FALSE(flowcap::schema::try_make_amount(""));
  EXPECT_FALSE(flowcap::schema::try_make_amount("-1"));
  EXPECT_FALSE(flowcap::schema::try_make_amount("1_000"));
}
