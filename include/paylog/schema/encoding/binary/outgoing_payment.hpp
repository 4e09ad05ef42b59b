#pragma once
#include <paylog/schema/encoding/binary/reader.hpp>
#include <paylog/schema/encoding/binary/writer.hpp>
#include <paylog/schema/outgoing_payment.hpp>

namespace paylog::schema::encoding::binary {

void encode(const outgoing_payment<1>& o, writer& out);
void decode(outgoing_payment<1>& o, reader& in, const decode_limits& limits);

/// Reject a payment that decode() would refuse to read back.
/// Throws store_error{invalid_length}.
void validate(const outgoing_payment<1>& o, const decode_limits& limits);

}  // namespace paylog::schema::encoding::binary
