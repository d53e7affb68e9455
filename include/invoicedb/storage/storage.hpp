#pragma once
#include <invoicedb/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace invoicedb::storage {

using key_value_entry_t =
    std::pair<invoicedb::schema::bytes_t, invoicedb::schema::bytes_t>;

/// Options applied when a storage backend is opened.
struct storage_options final {
  bool create_if_missing{true};
  /// Sync the write-ahead log on every commit.
  bool sync_writes{false};
};

template <typename Library>
class transaction;

/// A named keyspace. Buckets nest: a bucket holds key/value entries and
/// further buckets. Handles are only valid inside the transaction that
/// produced them.
template <typename Library>
class bucket {
 public:
  /// Raw value stored at key, or std::nullopt when missing.
  std::optional<invoicedb::schema::bytes_t> get(
      const invoicedb::schema::bytes_view_t& key) const;

  /// Store value at key, replacing any previous value.
  void put(const invoicedb::schema::bytes_view_t& key,
           const invoicedb::schema::bytes_view_t& value);

  /// Nested bucket with the given name, or std::nullopt when missing.
  std::optional<bucket> find_bucket(std::string_view name) const;

  /// Nested bucket with the given name, created when missing.
  bucket create_bucket_if_not_exists(std::string_view name);

  /// All entries in bytewise key order, followed by one (name, empty value)
  /// entry per nested bucket.
  std::vector<key_value_entry_t> entries() const;
};

/// A read-only snapshot or the single read-write transaction.
template <typename Library>
class transaction {
 public:
  bool writable() const;

  /// Top level bucket with the given name, or std::nullopt when missing.
  std::optional<bucket<Library>> find_bucket(std::string_view name);

  /// Top level bucket with the given name, created when missing.
  bucket<Library> create_bucket_if_not_exists(std::string_view name);
};

template <typename Library>
struct storage {
  /// Run fn(transaction&) against a consistent read-only snapshot and return
  /// its result.
  template <typename Fn>
  auto view(Fn&& fn) const;

  /// Run fn(transaction&) as the only writer. The transaction commits when
  /// the returned result reports ok() and rolls back otherwise.
  template <typename Fn>
  auto update(Fn&& fn);
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              const storage_options& options = {});

}  // namespace invoicedb::storage
