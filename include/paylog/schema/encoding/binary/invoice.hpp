#pragma once
#include <paylog/schema/encoding/binary/reader.hpp>
#include <paylog/schema/encoding/binary/writer.hpp>
#include <paylog/schema/invoice.hpp>

namespace paylog::schema::encoding::binary {

void encode(const invoice<1>& o, writer& out);
void decode(invoice<1>& o, reader& in, const decode_limits& limits);

}  // namespace paylog::schema::encoding::binary
