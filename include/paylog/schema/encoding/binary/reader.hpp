#pragma once
#include <paylog/schema/primitives.hpp>
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string_view>

namespace paylog::schema::encoding::binary {

/// Upper bounds applied while decoding untrusted records. A length prefix
/// above its bound is rejected before anything is allocated.
struct decode_limits final {
  uint32_t max_memo_length{1024};
  uint32_t max_receipt_length{1024};
  uint32_t max_path_length{20};
};

/// Consumes exactly the bytes a writer produced. Reading past the end throws
/// store_error{short_read}.
class reader final {
 public:
  explicit reader(const paylog::schema::bytes_view_t& bytes) : bytes_{bytes} {}

  uint32_t read_u32();
  int64_t read_i64();

  /// Read a u32-prefixed blob. `field` only feeds error messages.
  paylog::schema::bytes_t read_var_bytes(uint32_t max_length,
                                         std::string_view field);

  paylog::schema::bytes_view_t read_raw(std::size_t size);

  template <std::size_t N>
  void read_fixed(std::array<uint8_t, N>& out) {
    auto bytes = read_raw(N);
    std::ranges::copy(bytes, std::begin(out));
  }

  std::size_t offset() const { return offset_; }
  std::size_t remaining() const { return bytes_.size() - offset_; }

  /// Throws store_error{trailing_data} unless every byte was consumed.
  void expect_end() const;

 private:
  paylog::schema::bytes_view_t bytes_;
  std::size_t offset_{};
};

}  // namespace paylog::schema::encoding::binary
