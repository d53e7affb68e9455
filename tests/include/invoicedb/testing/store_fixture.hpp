#pragma once

#include <invoicedb/storage/rocksdb/storage.hpp>
#include <invoicedb/store/invoice_store.hpp>
#include <invoicedb/testing/common.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace invoicedb::testing {

/// Opens a throwaway RocksDB directory with an invoice store on top and
/// removes the directory on destruction.
class store_fixture final {
 public:
  explicit store_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)} {
    open();
  }

  store_fixture(const store_fixture&) = delete;
  store_fixture& operator=(const store_fixture&) = delete;
  store_fixture(store_fixture&&) = delete;
  store_fixture& operator=(store_fixture&&) = delete;

  ~store_fixture() {
    close();
    remove_path(db_path_);
  }

  const std::string& db_path() const { return db_path_; }

  invoicedb::store::encoder_t& encoder() { return encoder_; }
  invoicedb::store::storage_t& storage() { return *storage_; }
  invoicedb::store::invoice_store& store() { return *store_; }

  /// Close and reopen the database at the same path.
  void reopen() {
    close();
    open();
  }

 private:
  void open() {
    storage_.emplace(invoicedb::storage::make_storage<
                     invoicedb::storage::rocksdb_storage_tag>(db_path_));
    store_.emplace(encoder_, *storage_);
  }

  void close() {
    store_.reset();
    storage_.reset();
  }

  std::string db_path_;
  invoicedb::store::encoder_t encoder_;
  std::optional<invoicedb::store::storage_t> storage_;
  std::optional<invoicedb::store::invoice_store> store_;
};

}  // namespace invoicedb::testing
