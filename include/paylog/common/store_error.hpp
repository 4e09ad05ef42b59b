#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace paylog::common {

enum class store_error_code : uint32_t {
  short_read = 1,
  invalid_length = 2,
  trailing_data = 3,
  transaction_failure = 4,
  serialization_failure = 5,
  unsupported_version = 6,
  payment_hash_mismatch = 7,
};

std::string_view to_string(store_error_code code);

/// Failure raised by the record codec and the storage layer.
///
/// what() reads "<code>: <detail>"; code() is the stable discriminator.
class store_error final : public std::runtime_error {
 public:
  store_error(store_error_code code, const std::string& detail);

  store_error_code code() const { return code_; }

 private:
  store_error_code code_;
};

}  // namespace paylog::common
