#pragma once

#include <invoicedb/schema/encoding/scale/encoder.hpp>
#include <invoicedb/schema/invoice.hpp>
#include <invoicedb/schema/operation_result.hpp>
#include <invoicedb/schema/primitives.hpp>
#include <invoicedb/storage/rocksdb/storage.hpp>
#include <vector>

namespace invoicedb::store {

using encoder_t = invoicedb::schema::encoding::encoder<
    invoicedb::schema::encoding::scale_encoder_tag>;
using storage_t =
    invoicedb::storage::storage<invoicedb::storage::rocksdb_storage_tag>;

/// Reject invoices whose memo or receipt exceed their size caps.
invoicedb::schema::status_t validate_invoice(
    const invoicedb::schema::invoice_t& invoice);

/// Durable invoice storage.
///
/// Records live in the "invoices" bucket keyed by a big-endian identifier
/// that grows by one with every insert. The nested "paymenthashes" bucket
/// maps sha256(preimage) to that identifier and holds the identifier
/// counter. Invoices are never deleted; the only mutation after insertion is
/// settlement.
class invoice_store final {
 public:
  invoice_store(encoder_t& encoder, storage_t& storage);

  /// Insert a new invoice and return its identifier.
  ///
  /// Fails with invalid_invoice before touching storage when the memo or
  /// receipt is too large, and with duplicate_invoice when an invoice with
  /// the same payment hash exists. On failure nothing is written.
  invoicedb::schema::operation_result<invoicedb::schema::invoice_id_t>
  add_invoice(const invoicedb::schema::invoice_t& invoice);

  /// Find the invoice paying to payment_hash. Callers should check the
  /// returned terms (value, settled) before accepting a payment against it.
  invoicedb::schema::operation_result<invoicedb::schema::invoice_t>
  lookup_invoice(const invoicedb::schema::hash32_t& payment_hash) const;

  /// Every invoice in identifier order, or only the unsettled ones when
  /// pending_only is set. Fails with no_invoices_created when no invoice was
  /// ever added.
  invoicedb::schema::operation_result<std::vector<invoicedb::schema::invoice_t>>
  fetch_all_invoices(bool pending_only) const;

  /// Mark the invoice paying to payment_hash as settled. Settling an already
  /// settled invoice succeeds and changes nothing.
  invoicedb::schema::status_t settle_invoice(
      const invoicedb::schema::hash32_t& payment_hash);

 private:
  encoder_t& encoder_;
  storage_t& storage_;
};

}  // namespace invoicedb::store
