#include <invoicedb/common/critical.hpp>
#include <invoicedb/storage/rocksdb/storage.hpp>

#include <algorithm>
#include <iterator>

namespace invoicedb::storage {

namespace {

void require_valid_bucket_name(const std::string_view name) {
  if (name.empty() || static_cast<unsigned char>(name.front()) < 0x20 ||
      name.find(detail::kPathSeparator) != std::string_view::npos) {
    spdlog::error("Invalid bucket name of {} bytes", name.size());
    invoicedb::common::critical("invalid bucket name");
  }
}

}  // namespace

bucket<rocksdb_storage_tag>::bucket(transaction<rocksdb_storage_tag>& txn,
                                    std::string prefix)
    : transaction_{&txn}, prefix_{std::move(prefix)} {}

std::string bucket<rocksdb_storage_tag>::entry_key(
    const invoicedb::schema::bytes_view_t& key) const {
  auto out = prefix_;
  out.push_back(detail::kEntryTag);
  out.append(detail::to_string(key));
  return out;
}

std::string bucket<rocksdb_storage_tag>::bucket_marker_key(
    const std::string_view name) const {
  auto out = prefix_;
  out.push_back(detail::kBucketTag);
  out.append(name);
  return out;
}

std::string bucket<rocksdb_storage_tag>::child_prefix(
    const std::string_view name) const {
  auto out = prefix_;
  out.append(name);
  out.push_back(detail::kPathSeparator);
  return out;
}

std::optional<invoicedb::schema::bytes_t> bucket<rocksdb_storage_tag>::get(
    const invoicedb::schema::bytes_view_t& key) const {
  auto value = transaction_->get_raw(entry_key(key));
  if (!value) {
    return std::nullopt;
  }
  return detail::to_bytes(*value);
}

void bucket<rocksdb_storage_tag>::put(
    const invoicedb::schema::bytes_view_t& key,
    const invoicedb::schema::bytes_view_t& value) {
  transaction_->put_raw(entry_key(key), std::string_view{
                                            reinterpret_cast<const char*>(
                                                value.data()),
                                            value.size()});
}

std::optional<bucket<rocksdb_storage_tag>>
bucket<rocksdb_storage_tag>::find_bucket(const std::string_view name) const {
  require_valid_bucket_name(name);
  if (!transaction_->get_raw(bucket_marker_key(name))) {
    return std::nullopt;
  }
  return bucket{*transaction_, child_prefix(name)};
}

bucket<rocksdb_storage_tag>
bucket<rocksdb_storage_tag>::create_bucket_if_not_exists(
    const std::string_view name) {
  require_valid_bucket_name(name);
  auto marker = bucket_marker_key(name);
  if (!transaction_->get_raw(marker)) {
    transaction_->put_raw(marker, std::string_view{});
  }
  return bucket{*transaction_, child_prefix(name)};
}

std::vector<key_value_entry_t> bucket<rocksdb_storage_tag>::entries() const {
  auto entries = std::vector<key_value_entry_t>{};

  auto entry_prefix = prefix_ + detail::kEntryTag;
  for (const auto& [key, value] : transaction_->scan_raw(entry_prefix)) {
    entries.push_back(key_value_entry_t{
        detail::to_bytes(std::string_view{key}.substr(entry_prefix.size())),
        detail::to_bytes(value)});
  }

  auto marker_prefix = prefix_ + detail::kBucketTag;
  for (const auto& [key, value] : transaction_->scan_raw(marker_prefix)) {
    entries.push_back(key_value_entry_t{
        detail::to_bytes(std::string_view{key}.substr(marker_prefix.size())),
        invoicedb::schema::bytes_t{}});
  }
  return entries;
}

transaction<rocksdb_storage_tag>::transaction(
    ROCKSDB_NAMESPACE::TransactionDB& database)
    : database_{database} {
  snapshot_ = database_.GetSnapshot();
  read_options_.snapshot = snapshot_;
}

transaction<rocksdb_storage_tag>::transaction(
    ROCKSDB_NAMESPACE::TransactionDB& database,
    const ROCKSDB_NAMESPACE::WriteOptions& write_options)
    : database_{database},
      transaction_{database.BeginTransaction(write_options)} {
  if (!transaction_) {
    invoicedb::common::critical("Failed to begin RocksDB transaction");
  }
}

transaction<rocksdb_storage_tag>::~transaction() {
  if (transaction_ && !finished_) {
    auto status = transaction_->Rollback();
    if (!status.ok()) {
      spdlog::error("Failed to roll back RocksDB transaction: {}",
                    status.ToString());
    }
  }
  if (snapshot_ != nullptr) {
    database_.ReleaseSnapshot(snapshot_);
  }
}

bool transaction<rocksdb_storage_tag>::writable() const {
  return transaction_ != nullptr;
}

std::optional<bucket<rocksdb_storage_tag>>
transaction<rocksdb_storage_tag>::find_bucket(const std::string_view name) {
  return bucket<rocksdb_storage_tag>{*this, std::string{}}.find_bucket(name);
}

bucket<rocksdb_storage_tag>
transaction<rocksdb_storage_tag>::create_bucket_if_not_exists(
    const std::string_view name) {
  return bucket<rocksdb_storage_tag>{*this, std::string{}}
      .create_bucket_if_not_exists(name);
}

void transaction<rocksdb_storage_tag>::commit() {
  if (!transaction_ || finished_) {
    invoicedb::common::critical("No open RocksDB transaction to commit");
  }
  auto status = transaction_->Commit();
  finished_ = true;
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB transaction: {}",
                  status.ToString());
    invoicedb::common::critical("Failed to commit RocksDB transaction");
  }
}

void transaction<rocksdb_storage_tag>::rollback() {
  if (!transaction_ || finished_) {
    return;
  }
  auto status = transaction_->Rollback();
  finished_ = true;
  if (!status.ok()) {
    spdlog::error("Failed to roll back RocksDB transaction: {}",
                  status.ToString());
    invoicedb::common::critical("Failed to roll back RocksDB transaction");
  }
}

std::optional<std::string> transaction<rocksdb_storage_tag>::get_raw(
    const std::string& key) const {
  auto value = std::string{};
  auto status = ROCKSDB_NAMESPACE::Status{};
  if (transaction_) {
    status = transaction_->Get(read_options_, key, &value);
  } else {
    auto pinned = ROCKSDB_NAMESPACE::PinnableSlice{};
    status = database_.Get(read_options_, database_.DefaultColumnFamily(), key,
                           &pinned);
    if (status.ok()) {
      value = pinned.ToString();
    }
  }
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    invoicedb::common::critical("Failed to get value from RocksDB");
  }
  return value;
}

void transaction<rocksdb_storage_tag>::put_raw(const std::string& key,
                                               const std::string_view& value) {
  if (!transaction_ || finished_) {
    invoicedb::common::critical("Write attempted outside a write transaction");
  }
  auto status = transaction_->Put(
      key, ROCKSDB_NAMESPACE::Slice{value.data(), value.size()});
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    invoicedb::common::critical("Failed to put value into RocksDB");
  }
}

std::vector<std::pair<std::string, std::string>>
transaction<rocksdb_storage_tag>::scan_raw(const std::string& prefix) const {
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      transaction_ ? transaction_->GetIterator(read_options_)
                   : database_.NewIterator(read_options_,
                                           database_.DefaultColumnFamily())};

  auto rows = std::vector<std::pair<std::string, std::string>>{};
  iterator->Seek(prefix);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix)) {
      break;
    }
    rows.emplace_back(std::string{key_view}, iterator->value().ToString());
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("Failed iterating RocksDB: {}",
                  iterator->status().ToString());
    invoicedb::common::critical("Failed iterating RocksDB");
  }
  return rows;
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const storage_options& options) {
  auto store = storage<rocksdb_storage_tag>();
  store.options = options;

  auto db_options = ROCKSDB_NAMESPACE::Options{};
  db_options.create_if_missing = options.create_if_missing;
  db_options.IncreaseParallelism();
  db_options.OptimizeLevelStyleCompaction();

  auto txn_db_options = ROCKSDB_NAMESPACE::TransactionDBOptions{};
  ROCKSDB_NAMESPACE::TransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::TransactionDB::Open(
      db_options, txn_db_options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    invoicedb::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace invoicedb::storage
