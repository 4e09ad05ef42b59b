#include <paylog/common/critical.hpp>
#include <paylog/crypto/hash.hpp>

#include <openssl/evp.h>

#include <memory>

namespace paylog::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

paylog::schema::hash32_t sha256(const paylog::schema::bytes_view_t& bytes) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    paylog::common::critical("EVP_MD_CTX_new failed");
  }

  auto out = paylog::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &length) != 1 ||
      length != out.size()) {
    paylog::common::critical("sha256 digest failed");
  }
  return out;
}

paylog::schema::hash32_t make_payment_hash(
    const paylog::schema::preimage_t& preimage) {
  return sha256(paylog::schema::bytes_view_t{preimage.data(), preimage.size()});
}

bool payment_hash_matches(const paylog::schema::outgoing_payment_t& payment) {
  return make_payment_hash(payment.invoice.terms.payment_preimage) ==
         payment.payment_hash;
}

}  // namespace paylog::crypto
