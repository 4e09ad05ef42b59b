#include <paylog/common/store_error.hpp>
#include <paylog/schema/encoding/binary/reader.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>
#include <string>

namespace paylog::schema::encoding::binary {

namespace {

template <typename T>
T load_big(const paylog::schema::bytes_view_t& bytes) {
  auto value = T{};
  std::memcpy(&value, bytes.data(), sizeof(T));
  return boost::endian::big_to_native(value);
}

}  // namespace

uint32_t reader::read_u32() {
  return load_big<uint32_t>(read_raw(sizeof(uint32_t)));
}

int64_t reader::read_i64() {
  return load_big<int64_t>(read_raw(sizeof(int64_t)));
}

paylog::schema::bytes_t reader::read_var_bytes(const uint32_t max_length,
                                               const std::string_view field) {
  auto length = read_u32();
  if (length > max_length) {
    throw paylog::common::store_error{
        paylog::common::store_error_code::invalid_length,
        std::string{field} + " length " + std::to_string(length) +
            " exceeds limit " + std::to_string(max_length)};
  }
  if (length > remaining()) {
    throw paylog::common::store_error{
        paylog::common::store_error_code::short_read,
        std::string{field} + " declares " + std::to_string(length) +
            " bytes but only " + std::to_string(remaining()) + " remain"};
  }
  return paylog::schema::make_bytes(read_raw(length));
}

paylog::schema::bytes_view_t reader::read_raw(const std::size_t size) {
  if (size > remaining()) {
    throw paylog::common::store_error{
        paylog::common::store_error_code::short_read,
        "need " + std::to_string(size) + " bytes at offset " +
            std::to_string(offset_) + ", have " + std::to_string(remaining())};
  }
  auto out = bytes_.subspan(offset_, size);
  offset_ += size;
  return out;
}

void reader::expect_end() const {
  if (remaining() != 0) {
    throw paylog::common::store_error{
        paylog::common::store_error_code::trailing_data,
        std::to_string(remaining()) + " bytes left after offset " +
            std::to_string(offset_)};
  }
}

}  // namespace paylog::schema::encoding::binary
