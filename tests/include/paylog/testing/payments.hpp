#pragma once

#include <paylog/crypto/hash.hpp>
#include <paylog/schema/outgoing_payment.hpp>
#include <paylog/schema/primitives.hpp>
#include <paylog/testing/common.hpp>

#include <array>
#include <cstdint>
#include <random>
#include <string_view>

namespace paylog::testing {

inline constexpr auto kRevocationPreimage = paylog::schema::preimage_t{
    0x51, 0xb6, 0x37, 0xd8, 0xfc, 0xd2, 0xc6, 0xda, 0x63, 0x59, 0xe6,
    0x96, 0x31, 0x13, 0xa1, 0x17, 0x2d, 0xe7, 0x95, 0xe4, 0xb7, 0x25,
    0xb8, 0x4d, 0x1e, 0x0b, 0x4c, 0xfd, 0x9e, 0xc5, 0x8c, 0xe9};

/// The reference payment: fee 101, time lock 1000, three hops whose keys
/// repeat the hop index, payment_hash = sha256(preimage).
inline paylog::schema::outgoing_payment_t make_fake_payment() {
  auto payment = paylog::schema::outgoing_payment_t{};
  payment.invoice.creation_date = 1500000000;
  payment.invoice.memo =
      paylog::schema::make_bytes(std::string_view{"fake memo"});
  payment.invoice.receipt =
      paylog::schema::make_bytes(std::string_view{"fake receipt"});
  payment.invoice.terms.payment_preimage = kRevocationPreimage;
  payment.invoice.terms.value = 10000;
  payment.fee = 101;
  for (auto i = uint8_t{0}; i < 3; ++i) {
    payment.path.push_back(make_repeated_key(i));
  }
  payment.time_lock_length = 1000;
  payment.payment_hash = paylog::crypto::make_payment_hash(kRevocationPreimage);
  return payment;
}

struct random_payment_options final {
  std::size_t min_blob_length{1};
  std::size_t max_blob_length{49};
  std::size_t min_hops{1};
  std::size_t max_hops{5};
};

/// Seeded generator of valid payments. The same seed yields the same
/// sequence, so a failing case can be replayed from the logged seed.
class random_payment_generator final {
 public:
  explicit random_payment_generator(const uint64_t seed,
                                    random_payment_options options = {})
      : engine_{seed}, options_{options} {}

  paylog::schema::outgoing_payment_t next() {
    auto payment = paylog::schema::outgoing_payment_t{};
    payment.invoice.creation_date =
        uniform<paylog::schema::timestamp_seconds_t>(0, 4102444800);
    payment.invoice.memo = bytes(options_.min_blob_length,
                                 options_.max_blob_length);
    payment.invoice.receipt = bytes(options_.min_blob_length,
                                    options_.max_blob_length);
    fill(payment.invoice.terms.payment_preimage);
    payment.invoice.terms.value = uniform<paylog::schema::amount_t>(0, 9999);

    auto hops = uniform<std::size_t>(options_.min_hops, options_.max_hops);
    payment.path.resize(hops);
    for (auto& hop : payment.path) {
      fill(hop);
    }

    payment.fee = uniform<paylog::schema::amount_t>(0, 1000);
    payment.time_lock_length = uniform<uint32_t>(0, 9999);
    payment.payment_hash = paylog::crypto::make_payment_hash(
        payment.invoice.terms.payment_preimage);
    return payment;
  }

 private:
  template <typename T>
  T uniform(const T low, const T high) {
    return std::uniform_int_distribution<T>{low, high}(engine_);
  }

  paylog::schema::bytes_t bytes(const std::size_t min_length,
                                const std::size_t max_length) {
    auto out = paylog::schema::bytes_t(uniform(min_length, max_length));
    for (auto& byte : out) {
      byte = static_cast<uint8_t>(uniform<uint32_t>(0, 255));
    }
    return out;
  }

  template <std::size_t N>
  void fill(std::array<uint8_t, N>& out) {
    for (auto& byte : out) {
      byte = static_cast<uint8_t>(uniform<uint32_t>(0, 255));
    }
  }

  std::mt19937_64 engine_;
  random_payment_options options_;
};

}  // namespace paylog::testing
