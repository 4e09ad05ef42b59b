#pragma once

#include <paylog/schema/invoice.hpp>
#include <paylog/schema/primitives.hpp>
#include <cstdint>
#include <vector>

namespace paylog::schema {

template <uint16_t Version>
struct outgoing_payment;

/// Completed payment. `path[0]` is the first forwarding node.
///
/// `payment_hash` is expected to be sha256(invoice.terms.payment_preimage);
/// the codec stores whatever it is given.
template <>
struct outgoing_payment<1> final {
  invoice_t invoice;
  amount_t fee{};
  std::vector<public_key_t> path;
  uint32_t time_lock_length{};
  hash32_t payment_hash{};

  bool operator==(const outgoing_payment&) const = default;
};

using outgoing_payment_t = outgoing_payment<1>;

}  // namespace paylog::schema
