#include <paylog/schema/primitives.hpp>

#include <iterator>

namespace paylog::schema {

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return make_bytes_view(std::string_view{bytes});
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kDigits = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (auto byte : bytes) {
    out.push_back(kDigits[byte >> 4u]);
    out.push_back(kDigits[byte & 0x0Fu]);
  }
  return out;
}

}  // namespace paylog::schema
