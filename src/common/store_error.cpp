#include <paylog/common/store_error.hpp>

#include <algorithm>
#include <array>
#include <iterator>
#include <utility>

namespace paylog::common {

namespace {

using code_name_t = std::pair<std::string_view, store_error_code>;

constexpr auto kStoreErrorCodeNames = std::array{
    code_name_t{"short_read", store_error_code::short_read},
    code_name_t{"invalid_length", store_error_code::invalid_length},
    code_name_t{"trailing_data", store_error_code::trailing_data},
    code_name_t{"transaction_failure", store_error_code::transaction_failure},
    code_name_t{"serialization_failure",
                store_error_code::serialization_failure},
    code_name_t{"unsupported_version", store_error_code::unsupported_version},
    code_name_t{"payment_hash_mismatch",
                store_error_code::payment_hash_mismatch}};

std::string make_message(const store_error_code code,
                         const std::string& detail) {
  auto message = std::string{to_string(code)};
  if (!detail.empty()) {
    message.append(": ");
    message.append(detail);
  }
  return message;
}

}  // namespace

std::string_view to_string(const store_error_code code) {
  auto it = std::ranges::find(kStoreErrorCodeNames, code, &code_name_t::second);
  if (it == std::end(kStoreErrorCodeNames)) {
    return "unknown";
  }
  return it->first;
}

store_error::store_error(const store_error_code code, const std::string& detail)
    : std::runtime_error{make_message(code, detail)}, code_{code} {}

}  // namespace paylog::common
