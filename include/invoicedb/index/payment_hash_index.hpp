#pragma once

#include <invoicedb/schema/operation_result.hpp>
#include <invoicedb/schema/primitives.hpp>
#include <invoicedb/storage/rocksdb/storage.hpp>

namespace invoicedb::index {

/// Secondary index over the invoice keyspace, kept in the nested
/// "paymenthashes" bucket: payment hash -> identifier, plus the counter that
/// hands out identifiers.
///
/// Every method runs inside the caller's transaction, so the counter and the
/// index entries commit or roll back together with the invoice records they
/// describe.
class payment_hash_index final {
 public:
  using bucket_t = invoicedb::storage::bucket<
      invoicedb::storage::rocksdb_storage_tag>;

  explicit payment_hash_index(bucket_t index_bucket);

  /// Identifier the next inserted invoice receives. An absent counter reads
  /// as 0. Does not advance the counter.
  invoicedb::schema::operation_result<invoicedb::schema::invoice_id_t>
  next_identifier() const;

  /// Map payment_hash to id. Fails with duplicate_payment_hash when the hash
  /// is already indexed.
  invoicedb::schema::status_t reserve(
      const invoicedb::schema::hash32_t& payment_hash,
      invoicedb::schema::invoice_id_t id);

  /// Store id + 1 as the next identifier. Fails with identifier_exhausted
  /// when id is the last representable identifier.
  invoicedb::schema::status_t advance_counter(
      invoicedb::schema::invoice_id_t id);

  /// Identifier indexed under payment_hash, or invoice_not_found.
  invoicedb::schema::operation_result<invoicedb::schema::invoice_id_t> resolve(
      const invoicedb::schema::hash32_t& payment_hash) const;

 private:
  bucket_t bucket_;
};

}  // namespace invoicedb::index
