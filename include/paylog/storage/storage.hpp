#pragma once
#include <paylog/schema/primitives.hpp>
#include <paylog/schema/store_meta.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace paylog::storage {

/// Settings for opening a storage backend.
struct storage_options final {
  std::string path;
  bool create_if_missing{true};
  /// fsync the write-ahead log on every commit.
  bool sync_writes{false};
  /// How long a writer waits for a lock held by another writer.
  int64_t lock_timeout_ms{10000};
  /// Buckets created on open in addition to the internal meta bucket.
  std::vector<std::string> buckets;
};

/// Unit of work against a storage backend.
///
/// A read transaction observes one consistent snapshot. A write transaction
/// is committed explicitly and rolled back if destroyed uncommitted. Every
/// failure is reported as store_error{transaction_failure}.
template <typename Library>
struct transaction {
  bool writable() const;

  /// Value at key in bucket, or std::nullopt when missing.
  std::optional<paylog::schema::bytes_t> get(
      std::string_view bucket,
      const paylog::schema::bytes_view_t& key);

  void put(std::string_view bucket,
           const paylog::schema::bytes_view_t& key,
           const paylog::schema::bytes_view_t& value);

  /// Visit every entry of bucket in ascending key order.
  template <typename Fn>
  void for_each(std::string_view bucket, Fn&& fn);

  /// Remove every key of bucket. Returns the number of keys removed.
  std::size_t clear(std::string_view bucket);

  /// Lock the bucket's sequence counter for the rest of the transaction and
  /// return its current value.
  paylog::schema::sequence_t lock_sequence(std::string_view bucket);

  /// Lock, increment and return the bucket's sequence counter. The new
  /// value becomes durable only if the transaction commits.
  paylog::schema::sequence_t next_sequence(std::string_view bucket);

  void commit();
};

template <typename Library>
struct storage {
  /// Create bucket if it does not exist yet.
  void create_bucket(std::string_view name);

  bool has_bucket(std::string_view name) const;

  /// Run fn(transaction&) against a read-only snapshot.
  template <typename Fn>
  decltype(auto) view(Fn&& fn) const;

  /// Run fn(transaction&) in a write transaction. Commits when fn returns,
  /// rolls back when it throws.
  template <typename Fn>
  decltype(auto) update(Fn&& fn);

  /// Bookkeeping record written when the database was created.
  std::optional<paylog::schema::store_meta_t> load_store_meta() const;
};

/// Construct a concrete storage backend from options.
template <typename Library>
storage<Library> make_storage(const storage_options& options);

}  // namespace paylog::storage
