#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace paylog::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using preimage_t = std::array<uint8_t, 32>;
// Compressed secp256k1 public key of a forwarding node.
using public_key_t = std::array<uint8_t, 33>;
// Smallest monetary unit. Signed, never floating point.
using amount_t = int64_t;
using timestamp_seconds_t = int64_t;
using sequence_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

/// Lower case, no prefix. Used to name payments and records in log lines.
std::string to_hex(const bytes_view_t& bytes);

}  // namespace paylog::schema
