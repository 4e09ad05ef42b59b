#pragma once
#include <paylog/schema/primitives.hpp>
#include <boost/endian/conversion.hpp>
#include <cstdint>
#include <iterator>
#include <span>
#include <string_view>
#include <type_traits>

namespace paylog::schema::key {

/// Appends key parts. Integers are written big-endian so that the byte order
/// of the key matches numeric order under RocksDB's bytewise comparator.
struct builder final {
  paylog::schema::bytes_t data;

  builder& write(const std::string_view& str) {
    data.insert(std::end(data), std::begin(str), std::end(str));
    return *this;
  }

  builder& write(const std::span<const uint8_t>& bytes) {
    data.insert(std::end(data), std::begin(bytes), std::end(bytes));
    return *this;
  }

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    auto big = boost::endian::native_to_big(value);
    auto raw = reinterpret_cast<const uint8_t*>(&big);
    data.insert(std::end(data), raw, raw + sizeof(T));
    return *this;
  }
};

}  // namespace paylog::schema::key
