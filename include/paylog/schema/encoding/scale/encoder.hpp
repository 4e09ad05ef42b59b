#pragma once
#include <paylog/common/store_error.hpp>
#include <paylog/schema/encoding/encoder.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace paylog::schema::encoding {

struct scale_encoder_tag {};

/// SCALE codec used for storage bookkeeping records (schema version, etc.).
template <>
struct encoder<scale_encoder_tag> final {
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
paylog::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    throw paylog::common::store_error{
        paylog::common::store_error_code::serialization_failure,
        "failed to encode SCALE object"};
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        paylog::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const paylog::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    throw paylog::common::store_error{
        paylog::common::store_error_code::short_read,
        "failed to decode SCALE bytes"};
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const paylog::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace paylog::schema::encoding
