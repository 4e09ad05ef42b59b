#pragma once

#include <paylog/schema/primitives.hpp>
#include <paylog/storage/rocksdb/storage.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace paylog::testing {

using storage_t =
    paylog::storage::storage<paylog::storage::rocksdb_storage_tag>;

inline paylog::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = paylog::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline paylog::schema::public_key_t make_repeated_key(const uint8_t value) {
  auto out = paylog::schema::public_key_t{};
  out.fill(value);
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter++));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline storage_t open_storage(const std::string& path) {
  return paylog::storage::make_storage<paylog::storage::rocksdb_storage_tag>(
      paylog::storage::storage_options{.path = path});
}

/// Removes the database directory when the test scope ends.
class scoped_db_path final {
 public:
  explicit scoped_db_path(const std::string_view prefix)
      : path_{make_db_path(prefix)} {}

  scoped_db_path(const scoped_db_path&) = delete;
  scoped_db_path& operator=(const scoped_db_path&) = delete;

  ~scoped_db_path() { remove_path(path_); }

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace paylog::testing
