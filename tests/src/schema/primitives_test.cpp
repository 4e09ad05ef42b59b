#include <gtest/gtest.h>
#include <paylog/schema/primitives.hpp>

#include <string>
#include <string_view>

TEST(primitives, to_hex_is_lower_case_without_prefix) {
  auto payload = paylog::schema::bytes_t{0x00, 0x01, 0x7F, 0xAB, 0xFF};
  EXPECT_EQ(paylog::schema::to_hex(payload), "00017fabff");
  EXPECT_EQ(paylog::schema::to_hex(paylog::schema::bytes_t{}), "");
}

TEST(primitives, to_hex_accepts_fixed_arrays) {
  auto key = paylog::schema::public_key_t{};
  key.fill(0x02);
  auto expected = std::string{};
  for (std::size_t i = 0; i < key.size(); ++i) {
    expected += "02";
  }
  EXPECT_EQ(paylog::schema::to_hex(key), expected);
}

TEST(primitives, bytes_view_aliases_string_storage) {
  auto text = std::string{"fake memo"};
  auto view = paylog::schema::make_bytes_view(text);
  ASSERT_EQ(view.size(), text.size());
  EXPECT_EQ(static_cast<const void*>(view.data()),
            static_cast<const void*>(text.data()));
  EXPECT_EQ(view[0], static_cast<uint8_t>('f'));
}

TEST(primitives, make_bytes_copies_text_and_views) {
  auto from_text = paylog::schema::make_bytes(std::string_view{"ab"});
  EXPECT_EQ(from_text, (paylog::schema::bytes_t{'a', 'b'}));

  auto from_view = paylog::schema::make_bytes(
      paylog::schema::make_bytes_view(std::string_view{"ab"}));
  EXPECT_EQ(from_view, from_text);
}
