#pragma once

#include <paylog/schema/primitives.hpp>
#include <cstdint>

// Bookkeeping record written once when a database is first opened.
namespace paylog::schema {

template <uint16_t Version>
struct store_meta;

template <>
struct store_meta<1> final {
  uint32_t schema_version{1};
  timestamp_seconds_t created_at{};
};

using store_meta_t = store_meta<1>;

inline constexpr uint32_t kCurrentSchemaVersion = 1;

}  // namespace paylog::schema
