#pragma once

#include <paylog/schema/primitives.hpp>
#include <optional>
#include <string_view>

// Bucket names and key codecs for the payment archive.
namespace paylog::schema::key {

inline constexpr std::string_view kPaymentsBucket{"payments"};
inline constexpr std::string_view kMetaBucket{"meta"};

inline constexpr std::string_view kSequenceKeyPrefix{"SYS|SEQ|"};
inline constexpr std::string_view kSchemaVersionKey{"SYS|META|VERSION"};

inline constexpr std::size_t kSequenceKeySize = sizeof(sequence_t);

/// 8-byte big-endian record key.
paylog::schema::bytes_t make_sequence_key(sequence_t sequence);
std::optional<sequence_t> try_parse_sequence_key(
    const paylog::schema::bytes_view_t& key);

/// Key of the persisted sequence counter for `bucket` in the meta bucket.
paylog::schema::bytes_t make_sequence_counter_key(std::string_view bucket);

paylog::schema::bytes_t make_schema_version_key();

}  // namespace paylog::schema::key
