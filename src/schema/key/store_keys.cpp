#include <paylog/schema/key/builder.hpp>
#include <paylog/schema/key/store_keys.hpp>

#include <boost/endian/conversion.hpp>

#include <cstring>

namespace paylog::schema::key {

paylog::schema::bytes_t make_sequence_key(const sequence_t sequence) {
  auto b = builder{};
  b.write(sequence);
  return b.data;
}

std::optional<sequence_t> try_parse_sequence_key(
    const paylog::schema::bytes_view_t& key) {
  if (key.size() != kSequenceKeySize) {
    return std::nullopt;
  }
  auto value = sequence_t{};
  std::memcpy(&value, key.data(), sizeof(value));
  return boost::endian::big_to_native(value);
}

paylog::schema::bytes_t make_sequence_counter_key(
    const std::string_view bucket) {
  auto b = builder{};
  b.write(kSequenceKeyPrefix);
  b.write(bucket);
  return b.data;
}

paylog::schema::bytes_t make_schema_version_key() {
  auto b = builder{};
  b.write(kSchemaVersionKey);
  return b.data;
}

}  // namespace paylog::schema::key
