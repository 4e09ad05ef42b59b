#include <paylog/common/store_error.hpp>
#include <paylog/schema/encoding/binary/sink.hpp>
#include <paylog/schema/encoding/binary/writer.hpp>

#include <boost/endian/buffers.hpp>

#include <iterator>
#include <limits>
#include <string>

namespace paylog::schema::encoding::binary {

void vector_sink::write(const paylog::schema::bytes_view_t& bytes) {
  out_.insert(std::end(out_), std::begin(bytes), std::end(bytes));
}

void writer::write_u32(const uint32_t value) {
  auto buffer = boost::endian::big_uint32_buf_t{value};
  write_raw(paylog::schema::bytes_view_t{buffer.data(), sizeof(buffer)});
}

void writer::write_i64(const int64_t value) {
  auto buffer = boost::endian::big_int64_buf_t{value};
  write_raw(paylog::schema::bytes_view_t{buffer.data(), sizeof(buffer)});
}

void writer::write_var_bytes(const paylog::schema::bytes_view_t& bytes) {
  if (bytes.size() > std::numeric_limits<uint32_t>::max()) {
    throw paylog::common::store_error{
        paylog::common::store_error_code::invalid_length,
        "blob of " + std::to_string(bytes.size()) +
            " bytes does not fit a u32 length prefix"};
  }
  write_u32(static_cast<uint32_t>(bytes.size()));
  write_raw(bytes);
}

void writer::write_raw(const paylog::schema::bytes_view_t& bytes) {
  out_.write(bytes);
  written_ += bytes.size();
}

}  // namespace paylog::schema::encoding::binary
