#pragma once

#include <paylog/schema/primitives.hpp>
#include <cstdint>

namespace paylog::schema {

template <uint16_t Version>
struct payment_terms;

template <>
struct payment_terms<1> final {
  preimage_t payment_preimage{};
  amount_t value{};

  bool operator==(const payment_terms&) const = default;
};

using payment_terms_t = payment_terms<1>;

template <uint16_t Version>
struct invoice;

/// Payment request as archived alongside the payment that settled it.
template <>
struct invoice<1> final {
  timestamp_seconds_t creation_date{};
  bytes_t memo;
  bytes_t receipt;
  payment_terms<1> terms;

  bool operator==(const invoice&) const = default;
};

using invoice_t = invoice<1>;

}  // namespace paylog::schema
