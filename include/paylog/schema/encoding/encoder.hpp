#pragma once
#include <paylog/schema/primitives.hpp>
#include <optional>
#include <span>

namespace paylog::schema::encoding {

// The wire library is a build time choice, made by naming the tag:
//   auto enc = encoder<binary_encoder_tag>{};
// Payment records always use the binary tag since their on-disk layout is
// fixed. Store metadata goes through the SCALE tag.
template <typename Library>
struct encoder {
  template <typename T>
  paylog::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, paylog::schema::bytes_t& out);

  template <typename T>
  T decode(const paylog::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const paylog::schema::bytes_view_t& bytes);
};

}  // namespace paylog::schema::encoding
