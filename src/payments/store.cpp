#include <paylog/crypto/hash.hpp>
#include <paylog/payments/store.hpp>

#include <spdlog/spdlog.h>

#include <string>

using namespace paylog::schema;

namespace paylog::payments {

store::store(storage_t& storage, store_options options)
    : storage_{storage}, options_{options} {
  storage_.create_bucket(key::kPaymentsBucket);
}

void store::check_payment(const outgoing_payment_t& payment) const {
  encoding::binary::validate(payment, options_.limits);
  if (options_.verify_payment_hash &&
      !paylog::crypto::payment_hash_matches(payment)) {
    throw paylog::common::store_error{
        paylog::common::store_error_code::payment_hash_mismatch,
        "payment hash " + to_hex(payment.payment_hash) +
            " is not sha256 of the preimage"};
  }
}

void store::add_payment(const outgoing_payment_t& payment) {
  auto encoder = encoder_t{.limits = options_.limits};
  add_payment(encoder, payment);
}

std::vector<outgoing_payment_t> store::fetch_all_payments() const {
  auto encoder = encoder_t{.limits = options_.limits};
  auto payments = storage_.view([&](storage_t::transaction_t& txn) {
    auto out = std::vector<outgoing_payment_t>{};
    txn.for_each(key::kPaymentsBucket, [&](const bytes_view_t& record_key,
                                           const bytes_view_t& value) {
      auto sequence = key::try_parse_sequence_key(record_key);
      if (!sequence) {
        spdlog::error("Payment bucket holds a {} byte key, expected {}",
                      record_key.size(), key::kSequenceKeySize);
        throw paylog::common::store_error{
            paylog::common::store_error_code::invalid_length,
            "malformed payment key " + to_hex(record_key)};
      }
      try {
        out.push_back(encoder.decode<outgoing_payment_t>(value));
      } catch (const paylog::common::store_error& ex) {
        spdlog::error("Payment record {} is unreadable: {}", *sequence,
                      ex.what());
        throw;
      }
    });
    return out;
  });
  spdlog::debug("Fetched {} payment(s)", payments.size());
  return payments;
}

void store::delete_all_payments() {
  auto removed = storage_.update([](storage_t::transaction_t& txn) {
    // Hold the counter lock so no add interleaves with the sweep.
    txn.lock_sequence(key::kPaymentsBucket);
    return txn.clear(key::kPaymentsBucket);
  });
  spdlog::info("Deleted {} payment(s)", removed);
}

std::size_t store::payment_count() const {
  return storage_.view([](storage_t::transaction_t& txn) {
    auto count = std::size_t{0};
    txn.for_each(key::kPaymentsBucket,
                 [&](const bytes_view_t&, const bytes_view_t&) { ++count; });
    return count;
  });
}

}  // namespace paylog::payments
