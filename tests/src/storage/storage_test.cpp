#include <gtest/gtest.h>
#include <invoicedb/schema/operation_result.hpp>
#include <invoicedb/storage/rocksdb/storage.hpp>
#include <invoicedb/testing/common.hpp>

#include <optional>
#include <string>
#include <thread>

namespace {

using storage_t =
    invoicedb::storage::storage<invoicedb::storage::rocksdb_storage_tag>;
using transaction_t =
    invoicedb::storage::transaction<invoicedb::storage::rocksdb_storage_tag>;

using invoicedb::schema::invoice_error_code;
using invoicedb::schema::make_bytes;
using invoicedb::schema::make_bytes_view;
using invoicedb::schema::make_error;
using invoicedb::schema::make_ok;
using invoicedb::schema::status_t;

storage_t open_storage(const std::string& path) {
  return invoicedb::storage::make_storage<
      invoicedb::storage::rocksdb_storage_tag>(path);
}

std::optional<invoicedb::schema::bytes_t> read_entry(
    storage_t& storage,
    const std::string_view bucket_name,
    const std::string_view key) {
  return storage.view(
      [&](transaction_t& txn) -> std::optional<invoicedb::schema::bytes_t> {
        auto bucket = txn.find_bucket(bucket_name);
        if (!bucket) {
          return std::nullopt;
        }
        return bucket->get(make_bytes_view(key));
      });
}

}  // namespace

TEST(storage, defaults_are_stable) {
  auto options = invoicedb::storage::storage_options{};
  EXPECT_TRUE(options.create_if_missing);
  EXPECT_FALSE(options.sync_writes);

  auto entry = invoicedb::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage, committed_update_is_visible_to_later_views) {
  auto db = invoicedb::testing::make_db_path("invoicedb_storage_commit");
  {
    auto storage = open_storage(db);
    auto result = storage.update([](transaction_t& txn) -> status_t {
      EXPECT_TRUE(txn.writable());
      auto bucket = txn.create_bucket_if_not_exists("top");
      auto value = make_bytes(std::string_view{"value"});
      bucket.put(make_bytes_view(std::string_view{"key"}),
                 make_bytes_view(value));
      return make_ok();
    });
    ASSERT_TRUE(result.ok());

    auto stored = read_entry(storage, "top", "key");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(invoicedb::schema::make_string(*stored), "value");
  }
  invoicedb::testing::remove_path(db);
}

TEST(storage, failed_update_rolls_back_every_write) {
  auto db = invoicedb::testing::make_db_path("invoicedb_storage_rollback");
  {
    auto storage = open_storage(db);
    auto result = storage.update([](transaction_t& txn) -> status_t {
      auto bucket = txn.create_bucket_if_not_exists("top");
      auto value = make_bytes(std::string_view{"value"});
      bucket.put(make_bytes_view(std::string_view{"key"}),
                 make_bytes_view(value));
      return make_error<std::monostate>(invoice_error_code::invalid_invoice,
                                        "abort");
    });
    EXPECT_EQ(result.code, invoice_error_code::invalid_invoice);

    auto bucket_exists = storage.view([](transaction_t& txn) {
      return txn.find_bucket("top").has_value();
    });
    EXPECT_FALSE(bucket_exists);
  }
  invoicedb::testing::remove_path(db);
}

TEST(storage, view_transactions_are_read_only) {
  auto db = invoicedb::testing::make_db_path("invoicedb_storage_view");
  {
    auto storage = open_storage(db);
    auto writable =
        storage.view([](transaction_t& txn) { return txn.writable(); });
    EXPECT_FALSE(writable);
    auto missing = storage.view(
        [](transaction_t& txn) { return txn.find_bucket("absent"); });
    EXPECT_FALSE(missing.has_value());
  }
  invoicedb::testing::remove_path(db);
}

TEST(storage, writes_are_visible_inside_their_own_transaction) {
  auto db = invoicedb::testing::make_db_path("invoicedb_storage_own_writes");
  {
    auto storage = open_storage(db);
    auto result = storage.update([](transaction_t& txn) -> status_t {
      auto bucket = txn.create_bucket_if_not_exists("top");
      auto value = make_bytes(std::string_view{"v1"});
      bucket.put(make_bytes_view(std::string_view{"k"}),
                 make_bytes_view(value));

      auto again = txn.find_bucket("top");
      EXPECT_TRUE(again.has_value());
      auto read = again->get(make_bytes_view(std::string_view{"k"}));
      EXPECT_TRUE(read.has_value());
      EXPECT_EQ(*read, value);
      return make_ok();
    });
    EXPECT_TRUE(result.ok());
  }
  invoicedb::testing::remove_path(db);
}

TEST(storage, nested_buckets_keep_separate_keyspaces) {
  auto db = invoicedb::testing::make_db_path("invoicedb_storage_nested");
  {
    auto storage = open_storage(db);
    auto result = storage.update([](transaction_t& txn) -> status_t {
      auto parent = txn.create_bucket_if_not_exists("parent");
      auto child = parent.create_bucket_if_not_exists("child");
      auto parent_value = make_bytes(std::string_view{"p"});
      auto child_value = make_bytes(std::string_view{"c"});
      parent.put(make_bytes_view(std::string_view{"k"}),
                 make_bytes_view(parent_value));
      child.put(make_bytes_view(std::string_view{"k"}),
                make_bytes_view(child_value));
      return make_ok();
    });
    ASSERT_TRUE(result.ok());

    storage.view([](transaction_t& txn) {
      auto parent = txn.find_bucket("parent");
      ASSERT_TRUE(parent.has_value());
      auto child = parent->find_bucket("child");
      ASSERT_TRUE(child.has_value());

      auto parent_value = parent->get(make_bytes_view(std::string_view{"k"}));
      auto child_value = child->get(make_bytes_view(std::string_view{"k"}));
      ASSERT_TRUE(parent_value.has_value());
      ASSERT_TRUE(child_value.has_value());
      EXPECT_EQ(invoicedb::schema::make_string(*parent_value), "p");
      EXPECT_EQ(invoicedb::schema::make_string(*child_value), "c");

      // Nested buckets are not visible at the top level.
      EXPECT_FALSE(txn.find_bucket("child").has_value());
    });
  }
  invoicedb::testing::remove_path(db);
}

TEST(storage, entries_are_ordered_and_report_nested_buckets_last) {
  auto db = invoicedb::testing::make_db_path("invoicedb_storage_entries");
  {
    auto storage = open_storage(db);
    auto result = storage.update([](transaction_t& txn) -> status_t {
      auto bucket = txn.create_bucket_if_not_exists("top");
      bucket.create_bucket_if_not_exists("nested");
      for (auto id : {3u, 1u, 256u}) {
        auto key = invoicedb::schema::bytes_t{
            0, static_cast<uint8_t>(id >> 16u), static_cast<uint8_t>(id >> 8u),
            static_cast<uint8_t>(id)};
        auto value = invoicedb::schema::bytes_t{static_cast<uint8_t>(id)};
        bucket.put(make_bytes_view(key), make_bytes_view(value));
      }
      return make_ok();
    });
    ASSERT_TRUE(result.ok());

    auto entries = storage.view([](transaction_t& txn) {
      return txn.find_bucket("top")->entries();
    });
    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries[0].first, (invoicedb::schema::bytes_t{0, 0, 0, 1}));
    EXPECT_EQ(entries[1].first, (invoicedb::schema::bytes_t{0, 0, 0, 3}));
    EXPECT_EQ(entries[2].first, (invoicedb::schema::bytes_t{0, 0, 1, 0}));
    EXPECT_EQ(invoicedb::schema::make_string(entries[3].first), "nested");
    EXPECT_TRUE(entries[3].second.empty());
  }
  invoicedb::testing::remove_path(db);
}

TEST(storage, data_survives_reopen) {
  auto db = invoicedb::testing::make_db_path("invoicedb_storage_reopen");
  {
    auto storage = open_storage(db);
    auto result = storage.update([](transaction_t& txn) -> status_t {
      auto bucket = txn.create_bucket_if_not_exists("top");
      auto value = make_bytes(std::string_view{"durable"});
      bucket.put(make_bytes_view(std::string_view{"k"}),
                 make_bytes_view(value));
      return make_ok();
    });
    ASSERT_TRUE(result.ok());
  }
  {
    auto storage = open_storage(db);
    auto stored = read_entry(storage, "top", "k");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(invoicedb::schema::make_string(*stored), "durable");
  }
  invoicedb::testing::remove_path(db);
}

TEST(storage, open_view_keeps_its_snapshot_across_a_concurrent_commit) {
  auto db = invoicedb::testing::make_db_path("invoicedb_storage_snapshot");
  {
    auto storage = open_storage(db);
    auto seeded = storage.update([](transaction_t& txn) -> status_t {
      auto bucket = txn.create_bucket_if_not_exists("top");
      auto value = make_bytes(std::string_view{"old"});
      bucket.put(make_bytes_view(std::string_view{"k"}),
                 make_bytes_view(value));
      return make_ok();
    });
    ASSERT_TRUE(seeded.ok());

    storage.view([&](transaction_t& txn) {
      // Commit from another thread while this snapshot is held.
      auto writer = std::thread{[&storage]() {
        auto result = storage.update([](transaction_t& write_txn) -> status_t {
          auto bucket = write_txn.create_bucket_if_not_exists("top");
          auto value = make_bytes(std::string_view{"new"});
          bucket.put(make_bytes_view(std::string_view{"k"}),
                     make_bytes_view(value));
          bucket.put(make_bytes_view(std::string_view{"k2"}),
                     make_bytes_view(value));
          write_txn.create_bucket_if_not_exists("later");
          return make_ok();
        });
        EXPECT_TRUE(result.ok());
      }};
      writer.join();

      auto bucket = txn.find_bucket("top");
      ASSERT_TRUE(bucket.has_value());
      auto value = bucket->get(make_bytes_view(std::string_view{"k"}));
      ASSERT_TRUE(value.has_value());
      EXPECT_EQ(invoicedb::schema::make_string(*value), "old");
      EXPECT_FALSE(
          bucket->get(make_bytes_view(std::string_view{"k2"})).has_value());
      EXPECT_EQ(bucket->entries().size(), 1u);
      EXPECT_FALSE(txn.find_bucket("later").has_value());
    });

    auto value = read_entry(storage, "top", "k");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(invoicedb::schema::make_string(*value), "new");
    EXPECT_TRUE(read_entry(storage, "top", "k2").has_value());
  }
  invoicedb::testing::remove_path(db);
}
