#pragma once
#include <paylog/schema/encoding/binary/sink.hpp>
#include <paylog/schema/primitives.hpp>
#include <array>
#include <cstddef>
#include <cstdint>

namespace paylog::schema::encoding::binary {

/// Big-endian fixed width writer. Variable length blobs are written as a
/// u32 byte count followed by the raw bytes.
class writer final {
 public:
  explicit writer(sink& out) : out_{out} {}

  void write_u32(uint32_t value);
  void write_i64(int64_t value);
  void write_var_bytes(const paylog::schema::bytes_view_t& bytes);
  void write_raw(const paylog::schema::bytes_view_t& bytes);

  template <std::size_t N>
  void write_fixed(const std::array<uint8_t, N>& value) {
    write_raw(paylog::schema::bytes_view_t{value.data(), value.size()});
  }

  std::size_t written() const { return written_; }

 private:
  sink& out_;
  std::size_t written_{};
};

}  // namespace paylog::schema::encoding::binary
