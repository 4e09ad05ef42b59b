#include <paylog/crypto/hash.hpp>
#include <paylog/testing/payments.hpp>
#include <gtest/gtest.h>

#include <string_view>

TEST(crypto_hash, sha256_matches_known_vectors) {
  EXPECT_EQ(paylog::schema::to_hex(paylog::crypto::sha256(
                paylog::schema::make_bytes_view(std::string_view{}))),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(paylog::schema::to_hex(paylog::crypto::sha256(
                paylog::schema::make_bytes_view(std::string_view{"abc"}))),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(crypto_hash, payment_hash_is_sha256_of_preimage) {
  auto preimage = paylog::testing::kRevocationPreimage;
  EXPECT_EQ(paylog::crypto::make_payment_hash(preimage),
            paylog::crypto::sha256(
                paylog::schema::bytes_view_t{preimage.data(), preimage.size()}));
}

TEST(crypto_hash, payment_hash_matches_detects_mismatch) {
  auto payment = paylog::testing::make_fake_payment();
  EXPECT_TRUE(paylog::crypto::payment_hash_matches(payment));

  payment.payment_hash[0] ^= 0x01;
  EXPECT_FALSE(paylog::crypto::payment_hash_matches(payment));
}
