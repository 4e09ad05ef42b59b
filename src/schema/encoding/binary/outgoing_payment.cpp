#include <paylog/common/store_error.hpp>
#include <paylog/schema/encoding/binary/invoice.hpp>
#include <paylog/schema/encoding/binary/outgoing_payment.hpp>

#include <limits>
#include <string>

using namespace paylog::schema;

namespace paylog::schema::encoding::binary {

namespace {

void check_path_length(const std::size_t length, const decode_limits& limits) {
  if (length == 0 || length > limits.max_path_length) {
    throw paylog::common::store_error{
        paylog::common::store_error_code::invalid_length,
        "path length " + std::to_string(length) + " outside [1, " +
            std::to_string(limits.max_path_length) + "]"};
  }
}

void check_blob_length(const std::size_t length,
                       const uint32_t limit,
                       const std::string_view field) {
  if (length > limit) {
    throw paylog::common::store_error{
        paylog::common::store_error_code::invalid_length,
        std::string{field} + " length " + std::to_string(length) +
            " exceeds limit " + std::to_string(limit)};
  }
}

}  // namespace

void encode(const outgoing_payment<1>& o, writer& out) {
  encode(o.invoice, out);
  out.write_i64(o.fee);
  if (o.path.size() > std::numeric_limits<uint32_t>::max()) {
    throw paylog::common::store_error{
        paylog::common::store_error_code::invalid_length,
        "path does not fit a u32 count"};
  }
  out.write_u32(static_cast<uint32_t>(o.path.size()));
  for (const auto& hop : o.path) {
    out.write_fixed(hop);
  }
  out.write_u32(o.time_lock_length);
  out.write_fixed(o.payment_hash);
}

void decode(outgoing_payment<1>& o, reader& in, const decode_limits& limits) {
  decode(o.invoice, in, limits);
  o.fee = in.read_i64();

  auto hops = in.read_u32();
  check_path_length(hops, limits);
  // Check before reserving so a corrupt count cannot drive the allocation.
  if (static_cast<std::size_t>(hops) * public_key_t{}.size() > in.remaining()) {
    throw paylog::common::store_error{
        paylog::common::store_error_code::short_read,
        "path declares " + std::to_string(hops) + " hops but only " +
            std::to_string(in.remaining()) + " bytes remain"};
  }
  o.path.clear();
  o.path.reserve(hops);
  for (auto i = uint32_t{0}; i < hops; ++i) {
    auto& hop = o.path.emplace_back();
    in.read_fixed(hop);
  }

  o.time_lock_length = in.read_u32();
  in.read_fixed(o.payment_hash);
}

void validate(const outgoing_payment<1>& o, const decode_limits& limits) {
  check_blob_length(o.invoice.memo.size(), limits.max_memo_length, "memo");
  check_blob_length(o.invoice.receipt.size(), limits.max_receipt_length,
                    "receipt");
  check_path_length(o.path.size(), limits);
}

}  // namespace paylog::schema::encoding::binary
