#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <spdlog/spdlog.h>
#include <invoicedb/common/critical.hpp>
#include <invoicedb/storage/storage.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace invoicedb::storage {

namespace detail {

// Buckets are flattened onto a single RocksDB keyspace. A bucket at path
// [s1..sn] owns the prefix "s1\0...sn\0"; beneath it, data entries live at
// prefix + kEntryTag + key and nested bucket markers at
// prefix + kBucketTag + name. Bucket names never start with a control byte,
// so the tags cannot collide with a nested bucket's own prefix.
inline constexpr char kPathSeparator = '\0';
inline constexpr char kEntryTag = '\x01';
inline constexpr char kBucketTag = '\x02';

inline std::string to_string(const invoicedb::schema::bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()),
                     bytes.size()};
}

inline invoicedb::schema::bytes_t to_bytes(const std::string_view& str) {
  return {reinterpret_cast<const uint8_t*>(str.data()),
          reinterpret_cast<const uint8_t*>(str.data()) + str.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
class transaction<rocksdb_storage_tag>;

template <>
class bucket<rocksdb_storage_tag> final {
 public:
  bucket(transaction<rocksdb_storage_tag>& txn, std::string prefix);

  std::optional<invoicedb::schema::bytes_t> get(
      const invoicedb::schema::bytes_view_t& key) const;
  void put(const invoicedb::schema::bytes_view_t& key,
           const invoicedb::schema::bytes_view_t& value);
  std::optional<bucket> find_bucket(std::string_view name) const;
  bucket create_bucket_if_not_exists(std::string_view name);
  std::vector<key_value_entry_t> entries() const;

 private:
  std::string entry_key(const invoicedb::schema::bytes_view_t& key) const;
  std::string bucket_marker_key(std::string_view name) const;
  std::string child_prefix(std::string_view name) const;

  transaction<rocksdb_storage_tag>* transaction_;
  std::string prefix_;
};

template <>
class transaction<rocksdb_storage_tag> final {
 public:
  /// Read-only transaction over a database snapshot.
  explicit transaction(ROCKSDB_NAMESPACE::TransactionDB& database);

  /// Read-write transaction. Writes stay invisible to other readers until
  /// commit().
  transaction(ROCKSDB_NAMESPACE::TransactionDB& database,
              const ROCKSDB_NAMESPACE::WriteOptions& write_options);

  transaction(const transaction&) = delete;
  transaction& operator=(const transaction&) = delete;
  transaction(transaction&&) = delete;
  transaction& operator=(transaction&&) = delete;

  /// Rolls back a read-write transaction that was neither committed nor
  /// rolled back, and releases the snapshot of a read-only one.
  ~transaction();

  bool writable() const;

  std::optional<bucket<rocksdb_storage_tag>> find_bucket(
      std::string_view name);
  bucket<rocksdb_storage_tag> create_bucket_if_not_exists(
      std::string_view name);

  void commit();
  void rollback();

  std::optional<std::string> get_raw(const std::string& key) const;
  void put_raw(const std::string& key, const std::string_view& value);
  /// Every (key, value) whose key starts with prefix, in key order.
  std::vector<std::pair<std::string, std::string>> scan_raw(
      const std::string& prefix) const;

 private:
  ROCKSDB_NAMESPACE::TransactionDB& database_;
  ROCKSDB_NAMESPACE::ReadOptions read_options_;
  const ROCKSDB_NAMESPACE::Snapshot* snapshot_{nullptr};
  std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> transaction_;
  bool finished_{false};
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB> database;
  std::unique_ptr<std::mutex> writer_mutex{std::make_unique<std::mutex>()};
  storage_options options;

  template <typename Fn>
  auto view(Fn&& fn) const;

  template <typename Fn>
  auto update(Fn&& fn);
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const storage_options& options);

template <typename Fn>
auto storage<rocksdb_storage_tag>::view(Fn&& fn) const {
  if (!database) {
    invoicedb::common::critical("RocksDB database is not initialized");
  }
  auto txn = transaction<rocksdb_storage_tag>{*database};
  return std::forward<Fn>(fn)(txn);
}

template <typename Fn>
auto storage<rocksdb_storage_tag>::update(Fn&& fn) {
  if (!database || !writer_mutex) {
    invoicedb::common::critical("RocksDB database is not initialized");
  }
  auto lock = std::scoped_lock{*writer_mutex};
  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = options.sync_writes;
  auto txn = transaction<rocksdb_storage_tag>{*database, write_options};
  auto result = std::forward<Fn>(fn)(txn);
  if (result.ok()) {
    txn.commit();
  } else {
    txn.rollback();
  }
  return result;
}

}  // namespace invoicedb::storage
