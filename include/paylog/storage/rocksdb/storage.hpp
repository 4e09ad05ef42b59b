#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/snapshot.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <spdlog/spdlog.h>
#include <paylog/common/store_error.hpp>
#include <paylog/storage/storage.hpp>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace paylog::storage {

namespace detail {

/// Column family handles by bucket name. Handles must be released before the
/// database that issued them.
struct bucket_registry final {
  mutable std::shared_mutex mutex;
  std::map<std::string,
           std::unique_ptr<ROCKSDB_NAMESPACE::ColumnFamilyHandle>,
           std::less<>>
      handles;
};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const paylog::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline paylog::schema::bytes_view_t to_bytes_view(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return paylog::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(slice.data()), slice.size()};
}

inline paylog::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

/// Log and throw store_error{transaction_failure}.
[[noreturn]] void fail(std::string_view operation,
                       const ROCKSDB_NAMESPACE::Status& status);

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct transaction<rocksdb_storage_tag> final {
  transaction(ROCKSDB_NAMESPACE::TransactionDB& database,
              const detail::bucket_registry& buckets,
              std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> txn);
  ~transaction();

  transaction(const transaction&) = delete;
  transaction& operator=(const transaction&) = delete;

  bool writable() const { return txn_ != nullptr; }

  std::optional<paylog::schema::bytes_t> get(
      std::string_view bucket,
      const paylog::schema::bytes_view_t& key);

  void put(std::string_view bucket,
           const paylog::schema::bytes_view_t& key,
           const paylog::schema::bytes_view_t& value);

  template <typename Fn>
  void for_each(std::string_view bucket, Fn&& fn);

  std::size_t clear(std::string_view bucket);

  paylog::schema::sequence_t lock_sequence(std::string_view bucket);
  paylog::schema::sequence_t next_sequence(std::string_view bucket);

  void commit();

 private:
  ROCKSDB_NAMESPACE::ColumnFamilyHandle* handle(std::string_view bucket) const;
  std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> new_iterator(
      std::string_view bucket);
  void require_writable(std::string_view operation) const;

  ROCKSDB_NAMESPACE::TransactionDB& database_;
  const detail::bucket_registry& buckets_;
  std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> txn_;
  const ROCKSDB_NAMESPACE::Snapshot* snapshot_{nullptr};
  ROCKSDB_NAMESPACE::ReadOptions read_options_;
  bool finished_{false};
};

template <>
struct storage<rocksdb_storage_tag> final {
  using transaction_t = transaction<rocksdb_storage_tag>;

  // Declaration order matters: buckets are destroyed before the database.
  std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB> database;
  std::unique_ptr<detail::bucket_registry> buckets;
  ROCKSDB_NAMESPACE::WriteOptions write_options;
  std::string path;

  void create_bucket(std::string_view name);
  bool has_bucket(std::string_view name) const;

  transaction_t begin_read() const;
  transaction_t begin_write();

  template <typename Fn>
  decltype(auto) view(Fn&& fn) const;

  template <typename Fn>
  decltype(auto) update(Fn&& fn);

  std::optional<paylog::schema::store_meta_t> load_store_meta() const;

 private:
  void require_open() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const storage_options& options);

template <typename Fn>
void transaction<rocksdb_storage_tag>::for_each(std::string_view bucket,
                                                Fn&& fn) {
  auto iterator = new_iterator(bucket);
  for (iterator->SeekToFirst(); iterator->Valid(); iterator->Next()) {
    fn(detail::to_bytes_view(iterator->key()),
       detail::to_bytes_view(iterator->value()));
  }
  auto status = iterator->status();
  if (!status.ok()) {
    detail::fail("iterate bucket", status);
  }
}

template <typename Fn>
decltype(auto) storage<rocksdb_storage_tag>::view(Fn&& fn) const {
  auto txn = begin_read();
  return std::invoke(std::forward<Fn>(fn), txn);
}

template <typename Fn>
decltype(auto) storage<rocksdb_storage_tag>::update(Fn&& fn) {
  auto txn = begin_write();
  if constexpr (std::is_void_v<std::invoke_result_t<Fn, transaction_t&>>) {
    std::invoke(std::forward<Fn>(fn), txn);
    txn.commit();
  } else {
    auto result = std::invoke(std::forward<Fn>(fn), txn);
    txn.commit();
    return result;
  }
}

}  // namespace paylog::storage
