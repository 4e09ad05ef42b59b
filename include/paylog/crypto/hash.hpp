#pragma once

#include <paylog/schema/outgoing_payment.hpp>
#include <paylog/schema/primitives.hpp>

namespace paylog::crypto {

paylog::schema::hash32_t sha256(const paylog::schema::bytes_view_t& bytes);

/// sha256 of the preimage; the identifier a payment is archived under.
paylog::schema::hash32_t make_payment_hash(
    const paylog::schema::preimage_t& preimage);

bool payment_hash_matches(const paylog::schema::outgoing_payment_t& payment);

}  // namespace paylog::crypto
