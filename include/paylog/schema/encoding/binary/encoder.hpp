#pragma once
#include <paylog/common/store_error.hpp>
#include <paylog/schema/encoding/binary/invoice.hpp>
#include <paylog/schema/encoding/binary/outgoing_payment.hpp>
#include <paylog/schema/encoding/binary/reader.hpp>
#include <paylog/schema/encoding/binary/sink.hpp>
#include <paylog/schema/encoding/binary/writer.hpp>
#include <paylog/schema/encoding/encoder.hpp>
#include <spdlog/spdlog.h>

namespace paylog::schema::encoding {

struct binary_encoder_tag {};

/// Fixed layout big-endian codec for archived payment records.
///
/// decode() is strict: the whole input must be consumed, otherwise
/// store_error{trailing_data} is thrown.
template <>
struct encoder<binary_encoder_tag> final {
  binary::decode_limits limits{};

  template <typename T>
  paylog::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, paylog::schema::bytes_t& out);

  template <typename T>
  T decode(const paylog::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const paylog::schema::bytes_view_t& bytes);
};

template <typename T>
paylog::schema::bytes_t encoder<binary_encoder_tag>::encode(const T& obj) {
  auto out = paylog::schema::bytes_t{};
  encode(obj, out);
  return out;
}

template <typename T>
void encoder<binary_encoder_tag>::encode(const T& obj,
                                         paylog::schema::bytes_t& out) {
  auto sink = binary::vector_sink{out};
  auto w = binary::writer{sink};
  binary::encode(obj, w);
}

template <typename T>
T encoder<binary_encoder_tag>::decode(
    const paylog::schema::bytes_view_t& bytes) {
  auto r = binary::reader{bytes};
  auto obj = T{};
  binary::decode(obj, r, limits);
  r.expect_end();
  return obj;
}

template <typename T>
std::optional<T> encoder<binary_encoder_tag>::try_decode(
    const paylog::schema::bytes_view_t& bytes) {
  try {
    return decode<T>(bytes);
  } catch (const paylog::common::store_error& ex) {
    spdlog::debug("binary decode rejected {} bytes: {}", bytes.size(),
                  ex.what());
    return std::nullopt;
  }
}

}  // namespace paylog::schema::encoding
