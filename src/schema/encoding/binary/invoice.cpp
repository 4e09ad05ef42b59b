#include <paylog/schema/encoding/binary/invoice.hpp>

using namespace paylog::schema;

namespace paylog::schema::encoding::binary {

void encode(const invoice<1>& o, writer& out) {
  out.write_i64(o.creation_date);
  out.write_var_bytes(o.memo);
  out.write_var_bytes(o.receipt);
  out.write_fixed(o.terms.payment_preimage);
  out.write_i64(o.terms.value);
}

void decode(invoice<1>& o, reader& in, const decode_limits& limits) {
  o.creation_date = in.read_i64();
  o.memo = in.read_var_bytes(limits.max_memo_length, "memo");
  o.receipt = in.read_var_bytes(limits.max_receipt_length, "receipt");
  in.read_fixed(o.terms.payment_preimage);
  o.terms.value = in.read_i64();
}

}  // namespace paylog::schema::encoding::binary
