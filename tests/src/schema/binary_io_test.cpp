#include <paylog/common/store_error.hpp>
#include <paylog/schema/encoding/binary/reader.hpp>
#include <paylog/schema/encoding/binary/writer.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

using namespace paylog::schema;
using namespace paylog::schema::encoding::binary;
using paylog::common::store_error;
using paylog::common::store_error_code;

namespace {

template <typename Fn>
store_error_code capture_code(Fn&& fn) {
  try {
    fn();
  } catch (const store_error& ex) {
    return ex.code();
  }
  ADD_FAILURE() << "expected store_error";
  return store_error_code{};
}

}  // namespace

TEST(binary_writer, integers_are_big_endian) {
  auto out = bytes_t{};
  auto sink = vector_sink{out};
  auto w = writer{sink};
  w.write_u32(0x01020304u);
  w.write_i64(0x0102030405060708ll);
  w.write_i64(-2);

  auto expected = bytes_t{0x01, 0x02, 0x03, 0x04,
                          0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
                          0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFE};
  EXPECT_EQ(out, expected);
  EXPECT_EQ(w.written(), expected.size());
}

TEST(binary_writer, var_bytes_are_length_prefixed) {
  auto out = bytes_t{};
  auto sink = vector_sink{out};
  auto w = writer{sink};
  w.write_var_bytes(bytes_t{0xAA, 0xBB});
  w.write_var_bytes(bytes_t{});

  EXPECT_EQ(out, (bytes_t{0x00, 0x00, 0x00, 0x02, 0xAA, 0xBB,
                          0x00, 0x00, 0x00, 0x00}));
}

TEST(binary_reader, reads_back_what_writer_wrote) {
  auto out = bytes_t{};
  auto sink = vector_sink{out};
  auto w = writer{sink};
  w.write_u32(std::numeric_limits<uint32_t>::max());
  w.write_i64(std::numeric_limits<int64_t>::min());
  w.write_var_bytes(bytes_t{1, 2, 3});
  w.write_fixed(std::array<uint8_t, 4>{9, 8, 7, 6});

  auto r = reader{out};
  EXPECT_EQ(r.read_u32(), std::numeric_limits<uint32_t>::max());
  EXPECT_EQ(r.read_i64(), std::numeric_limits<int64_t>::min());
  EXPECT_EQ(r.read_var_bytes(16, "blob"), (bytes_t{1, 2, 3}));
  auto fixed = std::array<uint8_t, 4>{};
  r.read_fixed(fixed);
  EXPECT_EQ(fixed, (std::array<uint8_t, 4>{9, 8, 7, 6}));
  EXPECT_EQ(r.remaining(), 0u);
  EXPECT_NO_THROW(r.expect_end());
}

TEST(binary_reader, running_past_end_is_short_read) {
  auto bytes = bytes_t{0x00, 0x01, 0x02};
  auto r = reader{bytes};
  EXPECT_EQ(capture_code([&] { r.read_u32(); }), store_error_code::short_read);
  // A failed read consumes nothing.
  EXPECT_EQ(r.offset(), 0u);
}

TEST(binary_reader, length_prefix_above_limit_is_invalid_length) {
  auto bytes = bytes_t{0x00, 0x00, 0x10, 0x00};
  auto r = reader{bytes};
  EXPECT_EQ(capture_code([&] { r.read_var_bytes(1024, "memo"); }),
            store_error_code::invalid_length);
}

TEST(binary_reader, length_prefix_above_remaining_is_short_read) {
  auto bytes = bytes_t{0x00, 0x00, 0x00, 0x05, 0xAA};
  auto r = reader{bytes};
  EXPECT_EQ(capture_code([&] { r.read_var_bytes(1024, "memo"); }),
            store_error_code::short_read);
}

TEST(binary_reader, leftover_bytes_are_trailing_data) {
  auto bytes = bytes_t{0x00, 0x00, 0x00, 0x01, 0xFF};
  auto r = reader{bytes};
  EXPECT_EQ(r.read_u32(), 1u);
  EXPECT_EQ(capture_code([&] { r.expect_end(); }),
            store_error_code::trailing_data);
}
