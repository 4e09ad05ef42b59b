#pragma once

#include <paylog/common/store_error.hpp>
#include <paylog/schema/encoding/binary/encoder.hpp>
#include <paylog/schema/key/store_keys.hpp>
#include <paylog/schema/outgoing_payment.hpp>
#include <paylog/schema/primitives.hpp>
#include <paylog/storage/rocksdb/storage.hpp>
#include <spdlog/spdlog.h>
#include <cstddef>
#include <vector>

namespace paylog::payments {

struct store_options final {
  /// Bounds applied on write (validation) and on read (decoding).
  paylog::schema::encoding::binary::decode_limits limits{};
  /// Reject payments whose payment_hash is not sha256(preimage).
  bool verify_payment_hash{false};
};

/// Append-only archive of completed outgoing payments.
///
/// Records are keyed by a per-bucket sequence number drawn inside the same
/// write transaction that stores them, so fetch order is commit order. The
/// store keeps no cache and no locks of its own; concurrent writers are
/// serialized by the storage backend.
class store final {
 public:
  using storage_t =
      paylog::storage::storage<paylog::storage::rocksdb_storage_tag>;
  using encoder_t = paylog::schema::encoding::encoder<
      paylog::schema::encoding::binary_encoder_tag>;

  explicit store(storage_t& storage, store_options options = {});

  /// Encode and append payment. Either the whole record becomes visible or
  /// nothing does.
  void add_payment(const paylog::schema::outgoing_payment_t& payment);

  /// As above, with a caller supplied encoder for the record bytes.
  template <typename Encoder>
  void add_payment(Encoder& encoder,
                   const paylog::schema::outgoing_payment_t& payment);

  /// Every archived payment in insertion order. A record that fails to
  /// decode aborts the whole fetch.
  std::vector<paylog::schema::outgoing_payment_t> fetch_all_payments() const;

  /// Remove every archived payment. Sequence numbers are not reused.
  void delete_all_payments();

  std::size_t payment_count() const;

  const store_options& options() const { return options_; }

 private:
  void check_payment(const paylog::schema::outgoing_payment_t& payment) const;

  storage_t& storage_;
  store_options options_;
};

template <typename Encoder>
void store::add_payment(Encoder& encoder,
                        const paylog::schema::outgoing_payment_t& payment) {
  check_payment(payment);
  try {
    auto sequence = storage_.update([&](storage_t::transaction_t& txn) {
      auto next = txn.next_sequence(paylog::schema::key::kPaymentsBucket);
      auto value = encoder.encode(payment);
      txn.put(paylog::schema::key::kPaymentsBucket,
              paylog::schema::key::make_sequence_key(next), value);
      return next;
    });
    spdlog::debug("Archived payment {} as record {}",
                  paylog::schema::to_hex(payment.payment_hash), sequence);
  } catch (const paylog::common::store_error& ex) {
    spdlog::warn("Failed to archive payment {}: {}",
                 paylog::schema::to_hex(payment.payment_hash), ex.what());
    throw;
  }
}

}  // namespace paylog::payments
