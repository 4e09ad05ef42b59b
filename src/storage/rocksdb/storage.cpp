#include <paylog/schema/encoding/scale/encoder.hpp>
#include <paylog/schema/key/store_keys.hpp>
#include <paylog/storage/rocksdb/storage.hpp>

#include <algorithm>
#include <chrono>
#include <mutex>
#include <tuple>
#include <vector>

namespace paylog::storage {

namespace {

using encoder_t = paylog::schema::encoding::encoder<
    paylog::schema::encoding::scale_encoder_tag>;
using store_error = paylog::common::store_error;
using store_error_code = paylog::common::store_error_code;

void add_bucket_name(std::vector<std::string>& names, std::string_view name) {
  if (std::ranges::find(names, name) == std::end(names)) {
    names.emplace_back(name);
  }
}

paylog::schema::timestamp_seconds_t now_seconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// Write the bookkeeping record on first open and refuse databases written by
// a newer schema.
void ensure_store_meta(storage<rocksdb_storage_tag>& store) {
  auto existing = store.load_store_meta();
  if (existing) {
    if (existing->schema_version > paylog::schema::kCurrentSchemaVersion) {
      spdlog::error("Database at {} has schema version {}, supported is {}",
                    store.path, existing->schema_version,
                    paylog::schema::kCurrentSchemaVersion);
      throw store_error{store_error_code::unsupported_version,
                        "schema version " +
                            std::to_string(existing->schema_version)};
    }
    return;
  }

  auto meta = paylog::schema::store_meta_t{
      .schema_version = paylog::schema::kCurrentSchemaVersion,
      .created_at = now_seconds()};
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(std::tuple{meta.schema_version, meta.created_at});
  auto key = paylog::schema::key::make_schema_version_key();
  store.update([&](transaction<rocksdb_storage_tag>& txn) {
    txn.put(paylog::schema::key::kMetaBucket, key, encoded);
  });
  spdlog::info("Initialized schema version {} at {}", meta.schema_version,
               store.path);
}

}  // namespace

namespace detail {

void fail(const std::string_view operation,
          const ROCKSDB_NAMESPACE::Status& status) {
  spdlog::error("RocksDB {} failed: {}", operation, status.ToString());
  throw store_error{store_error_code::transaction_failure,
                    std::string{operation} + ": " + status.ToString()};
}

}  // namespace detail

transaction<rocksdb_storage_tag>::transaction(
    ROCKSDB_NAMESPACE::TransactionDB& database,
    const detail::bucket_registry& buckets,
    std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> txn)
    : database_{database}, buckets_{buckets}, txn_{std::move(txn)} {
  if (!txn_) {
    snapshot_ = database_.GetSnapshot();
    read_options_.snapshot = snapshot_;
  }
}

transaction<rocksdb_storage_tag>::~transaction() {
  if (snapshot_ != nullptr) {
    database_.ReleaseSnapshot(snapshot_);
  }
  if (txn_ && !finished_) {
    auto status = txn_->Rollback();
    if (!status.ok()) {
      spdlog::warn("RocksDB rollback failed: {}", status.ToString());
    } else {
      spdlog::debug("Rolled back uncommitted transaction");
    }
  }
}

ROCKSDB_NAMESPACE::ColumnFamilyHandle* transaction<rocksdb_storage_tag>::handle(
    const std::string_view bucket) const {
  auto lock = std::shared_lock{buckets_.mutex};
  auto it = buckets_.handles.find(bucket);
  if (it == std::end(buckets_.handles)) {
    throw store_error{store_error_code::transaction_failure,
                      "unknown bucket '" + std::string{bucket} + "'"};
  }
  return it->second.get();
}

void transaction<rocksdb_storage_tag>::require_writable(
    const std::string_view operation) const {
  if (!txn_) {
    throw store_error{store_error_code::transaction_failure,
                      std::string{operation} + " in a read-only transaction"};
  }
  if (finished_) {
    throw store_error{store_error_code::transaction_failure,
                      std::string{operation} + " after commit"};
  }
}

std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>
transaction<rocksdb_storage_tag>::new_iterator(const std::string_view bucket) {
  auto* family = handle(bucket);
  if (txn_) {
    return std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
        txn_->GetIterator(read_options_, family)};
  }
  return std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database_.NewIterator(read_options_, family)};
}

std::optional<paylog::schema::bytes_t> transaction<rocksdb_storage_tag>::get(
    const std::string_view bucket,
    const paylog::schema::bytes_view_t& key) {
  auto* family = handle(bucket);
  auto value = std::string{};
  auto status = txn_ ? txn_->Get(read_options_, family, detail::to_slice(key),
                                 &value)
                     : database_.Get(read_options_, family,
                                     detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    detail::fail("get", status);
  }
  return paylog::schema::make_bytes(paylog::schema::make_bytes_view(value));
}

void transaction<rocksdb_storage_tag>::put(
    const std::string_view bucket,
    const paylog::schema::bytes_view_t& key,
    const paylog::schema::bytes_view_t& value) {
  require_writable("put");
  auto status =
      txn_->Put(handle(bucket), detail::to_slice(key), detail::to_slice(value));
  if (!status.ok()) {
    detail::fail("put", status);
  }
}

std::size_t transaction<rocksdb_storage_tag>::clear(
    const std::string_view bucket) {
  require_writable("clear");
  // Collect first: deleting through the transaction while its iterator is
  // live would mutate the batch the iterator reads from.
  auto keys = std::vector<paylog::schema::bytes_t>{};
  for_each(bucket, [&](const paylog::schema::bytes_view_t& key,
                       const paylog::schema::bytes_view_t&) {
    keys.push_back(paylog::schema::make_bytes(key));
  });

  auto* family = handle(bucket);
  for (const auto& key : keys) {
    auto status = txn_->Delete(family, detail::to_slice(key));
    if (!status.ok()) {
      detail::fail("delete", status);
    }
  }
  return keys.size();
}

paylog::schema::sequence_t transaction<rocksdb_storage_tag>::lock_sequence(
    const std::string_view bucket) {
  require_writable("lock_sequence");
  auto key = paylog::schema::key::make_sequence_counter_key(bucket);
  auto value = std::string{};
  auto status =
      txn_->GetForUpdate(read_options_, handle(paylog::schema::key::kMetaBucket),
                         detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return 0;
  }
  if (!status.ok()) {
    detail::fail("lock sequence", status);
  }
  auto sequence = paylog::schema::key::try_parse_sequence_key(
      paylog::schema::make_bytes_view(value));
  if (!sequence) {
    spdlog::error("Sequence counter for bucket '{}' is {} bytes, expected {}",
                  bucket, value.size(), paylog::schema::key::kSequenceKeySize);
    throw store_error{store_error_code::transaction_failure,
                      "corrupt sequence counter for bucket '" +
                          std::string{bucket} + "'"};
  }
  return *sequence;
}

paylog::schema::sequence_t transaction<rocksdb_storage_tag>::next_sequence(
    const std::string_view bucket) {
  auto next = lock_sequence(bucket) + 1;
  put(paylog::schema::key::kMetaBucket,
      paylog::schema::key::make_sequence_counter_key(bucket),
      paylog::schema::key::make_sequence_key(next));
  return next;
}

void transaction<rocksdb_storage_tag>::commit() {
  require_writable("commit");
  auto status = txn_->Commit();
  if (!status.ok()) {
    detail::fail("commit", status);
  }
  finished_ = true;
}

void storage<rocksdb_storage_tag>::require_open() const {
  if (!database || !buckets) {
    throw store_error{store_error_code::transaction_failure,
                      "RocksDB database is not initialized"};
  }
}

void storage<rocksdb_storage_tag>::create_bucket(const std::string_view name) {
  require_open();
  auto lock = std::unique_lock{buckets->mutex};
  if (buckets->handles.contains(name)) {
    return;
  }
  ROCKSDB_NAMESPACE::ColumnFamilyHandle* family{nullptr};
  auto status = database->CreateColumnFamily(
      ROCKSDB_NAMESPACE::ColumnFamilyOptions{}, std::string{name}, &family);
  if (!status.ok()) {
    detail::fail("create bucket", status);
  }
  buckets->handles.emplace(std::string{name},
                           std::unique_ptr<ROCKSDB_NAMESPACE::ColumnFamilyHandle>{
                               family});
  spdlog::info("Created bucket '{}'", name);
}

bool storage<rocksdb_storage_tag>::has_bucket(const std::string_view name) const {
  require_open();
  auto lock = std::shared_lock{buckets->mutex};
  return buckets->handles.contains(name);
}

storage<rocksdb_storage_tag>::transaction_t
storage<rocksdb_storage_tag>::begin_read() const {
  require_open();
  return transaction_t{*database, *buckets, nullptr};
}

storage<rocksdb_storage_tag>::transaction_t
storage<rocksdb_storage_tag>::begin_write() {
  require_open();
  // No snapshot: a writer that waited on a lock must read the value its
  // predecessor committed, not fail validation against an older snapshot.
  auto txn_options = ROCKSDB_NAMESPACE::TransactionOptions{};
  txn_options.set_snapshot = false;
  auto txn = std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{
      database->BeginTransaction(write_options, txn_options)};
  if (!txn) {
    throw store_error{store_error_code::transaction_failure,
                      "failed to begin RocksDB transaction"};
  }
  return transaction_t{*database, *buckets, std::move(txn)};
}

std::optional<paylog::schema::store_meta_t>
storage<rocksdb_storage_tag>::load_store_meta() const {
  auto raw = view([](transaction_t& txn) {
    return txn.get(paylog::schema::key::kMetaBucket,
                   paylog::schema::key::make_schema_version_key());
  });
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<uint32_t, paylog::schema::timestamp_seconds_t>>(
          paylog::schema::bytes_view_t{raw->data(), raw->size()});
  if (!decoded) {
    spdlog::error("Failed decoding schema version record at {}", path);
    throw store_error{store_error_code::short_read,
                      "corrupt schema version record"};
  }
  return paylog::schema::store_meta_t{
      .schema_version = std::get<0>(decoded.value()),
      .created_at = std::get<1>(decoded.value())};
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const storage_options& options) {
  auto store = storage<rocksdb_storage_tag>{};
  store.path = options.path;
  store.write_options.sync = options.sync_writes;

  auto db_options = ROCKSDB_NAMESPACE::Options{};
  db_options.create_if_missing = options.create_if_missing;
  db_options.create_missing_column_families = true;
  db_options.IncreaseParallelism();
  db_options.OptimizeLevelStyleCompaction();

  auto txn_db_options = ROCKSDB_NAMESPACE::TransactionDBOptions{};
  txn_db_options.transaction_lock_timeout = options.lock_timeout_ms;

  auto names = std::vector<std::string>{};
  auto list_status = ROCKSDB_NAMESPACE::DB::ListColumnFamilies(
      db_options, options.path, &names);
  if (!list_status.ok()) {
    // Expected for a database that does not exist yet.
    spdlog::debug("No column families listed at {}: {}", options.path,
                  list_status.ToString());
    names.clear();
  }
  add_bucket_name(names, ROCKSDB_NAMESPACE::kDefaultColumnFamilyName);
  add_bucket_name(names, paylog::schema::key::kMetaBucket);
  for (const auto& bucket : options.buckets) {
    add_bucket_name(names, bucket);
  }

  auto descriptors = std::vector<ROCKSDB_NAMESPACE::ColumnFamilyDescriptor>{};
  descriptors.reserve(names.size());
  for (const auto& name : names) {
    descriptors.emplace_back(name, ROCKSDB_NAMESPACE::ColumnFamilyOptions{});
  }

  auto handles = std::vector<ROCKSDB_NAMESPACE::ColumnFamilyHandle*>{};
  ROCKSDB_NAMESPACE::TransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::TransactionDB::Open(
      db_options, txn_db_options, options.path, descriptors, &handles,
      &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", options.path,
                  status.ToString());
    throw store_error{store_error_code::transaction_failure,
                      "open " + options.path + ": " + status.ToString()};
  }
  store.database.reset(database);
  store.buckets = std::make_unique<detail::bucket_registry>();
  for (std::size_t i = 0; i < handles.size(); ++i) {
    store.buckets->handles.emplace(
        names[i],
        std::unique_ptr<ROCKSDB_NAMESPACE::ColumnFamilyHandle>{handles[i]});
  }
  spdlog::info("Successfully opened RocksDB at {} with {} bucket(s)",
               options.path, handles.size());

  ensure_store_meta(store);
  return store;
}

}  // namespace paylog::storage
