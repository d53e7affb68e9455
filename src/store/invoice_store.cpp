#include <invoicedb/crypto/sha256.hpp>
#include <invoicedb/index/payment_hash_index.hpp>
#include <invoicedb/schema/encoding/scale/invoice.hpp>
#include <invoicedb/schema/key/invoice_keys.hpp>
#include <invoicedb/store/invoice_store.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <utility>

using namespace invoicedb::schema;
using invoicedb::schema::encoding::scale::decode_invoice;
using invoicedb::schema::encoding::scale::encode_invoice;

namespace {

using bucket_t =
    invoicedb::storage::bucket<invoicedb::storage::rocksdb_storage_tag>;
using transaction_t =
    invoicedb::storage::transaction<invoicedb::storage::rocksdb_storage_tag>;

struct resolved_invoice final {
  bucket_t invoices;
  invoice_id_t id{};
};

std::string hash_to_hex(const hash32_t& hash) {
  return to_hex(bytes_view_t{hash.data(), hash.size()});
}

// Walks invoices -> paymenthashes -> hash entry. A missing level at any
// point means the invoice does not exist.
operation_result<resolved_invoice> resolve_invoice(
    transaction_t& txn,
    const hash32_t& payment_hash) {
  auto invoices = txn.find_bucket(key::kInvoiceBucket);
  if (!invoices) {
    return make_error<resolved_invoice>(invoice_error_code::invoice_not_found,
                                        "no invoices have been created");
  }
  auto index_bucket = invoices->find_bucket(key::kPaymentHashIndexBucket);
  if (!index_bucket) {
    return make_error<resolved_invoice>(invoice_error_code::invoice_not_found,
                                        "payment hash index does not exist");
  }
  auto id =
      invoicedb::index::payment_hash_index{std::move(*index_bucket)}.resolve(
          payment_hash);
  if (!id.ok()) {
    return forward_error<resolved_invoice>(id);
  }
  return make_ok(resolved_invoice{.invoices = std::move(*invoices),
                                  .id = *id.value});
}

operation_result<invoice_t> fetch_invoice(
    invoicedb::store::encoder_t& encoder,
    const bucket_t& invoices,
    const invoice_id_t id) {
  auto record_key = key::make_invoice_key(id);
  auto record = invoices.get(make_bytes_view(record_key));
  if (!record) {
    return make_error<invoice_t>(invoice_error_code::invoice_not_found,
                                 fmt::format("invoice {} has no record", id));
  }
  auto decoded = decode_invoice(encoder, make_bytes_view(*record));
  if (!decoded.ok()) {
    spdlog::error("Invoice {} is malformed: {}", id, decoded.log);
  }
  return decoded;
}

}  // namespace

namespace invoicedb::store {

status_t validate_invoice(const invoice_t& invoice) {
  if (invoice.memo.size() > kMaxMemoSize) {
    return make_error<std::monostate>(
        invoice_error_code::invalid_invoice,
        fmt::format("max length of a memo is {}, and invoice of length {} "
                    "was provided",
                    kMaxMemoSize, invoice.memo.size()));
  }
  if (invoice.receipt.size() > kMaxReceiptSize) {
    return make_error<std::monostate>(
        invoice_error_code::invalid_invoice,
        fmt::format("max length of a receipt is {}, and invoice of length {} "
                    "was provided",
                    kMaxReceiptSize, invoice.receipt.size()));
  }
  return make_ok();
}

invoice_store::invoice_store(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

operation_result<invoice_id_t> invoice_store::add_invoice(
    const invoice_t& invoice) {
  auto valid = validate_invoice(invoice);
  if (!valid.ok()) {
    spdlog::warn("Rejecting invoice: {}", valid.log);
    return forward_error<invoice_id_t>(valid);
  }

  auto payment_hash = invoicedb::crypto::payment_hash(
      invoice.terms.payment_preimage);
  auto hash_hex = hash_to_hex(payment_hash);

  auto result = storage_.update(
      [&](transaction_t& txn) -> operation_result<invoice_id_t> {
        auto invoices = txn.create_bucket_if_not_exists(key::kInvoiceBucket);
        auto index = invoicedb::index::payment_hash_index{
            invoices.create_bucket_if_not_exists(
                key::kPaymentHashIndexBucket)};

        auto existing = index.resolve(payment_hash);
        if (existing.ok()) {
          return make_error<invoice_id_t>(
              invoice_error_code::duplicate_invoice,
              fmt::format("invoice {} already pays to hash {}",
                          *existing.value, hash_hex));
        }
        if (existing.code != invoice_error_code::invoice_not_found) {
          return existing;
        }

        auto next = index.next_identifier();
        if (!next.ok()) {
          return next;
        }
        auto id = *next.value;

        auto reserved = index.reserve(payment_hash, id);
        if (!reserved.ok()) {
          return forward_error<invoice_id_t>(reserved);
        }
        auto advanced = index.advance_counter(id);
        if (!advanced.ok()) {
          return forward_error<invoice_id_t>(advanced);
        }

        auto record_key = key::make_invoice_key(id);
        auto record = encode_invoice(encoder_, invoice);
        invoices.put(make_bytes_view(record_key), make_bytes_view(record));
        return make_ok(id);
      });

  if (result.ok()) {
    spdlog::debug("Added invoice {} for payment hash {}", *result.value,
                  hash_hex);
  } else {
    spdlog::warn("Failed to add invoice for payment hash {}: {}", hash_hex,
                 result.log);
  }
  return result;
}

operation_result<invoice_t> invoice_store::lookup_invoice(
    const hash32_t& payment_hash) const {
  return storage_.view([&](transaction_t& txn) -> operation_result<invoice_t> {
    auto resolved = resolve_invoice(txn, payment_hash);
    if (!resolved.ok()) {
      return forward_error<invoice_t>(resolved);
    }
    return fetch_invoice(encoder_, resolved.value->invoices,
                         resolved.value->id);
  });
}

operation_result<std::vector<invoice_t>> invoice_store::fetch_all_invoices(
    const bool pending_only) const {
  return storage_.view(
      [&](transaction_t& txn) -> operation_result<std::vector<invoice_t>> {
        auto invoices = txn.find_bucket(key::kInvoiceBucket);
        if (!invoices) {
          return make_error<std::vector<invoice_t>>(
              invoice_error_code::no_invoices_created,
              "no invoices have been created");
        }

        auto out = std::vector<invoice_t>{};
        for (const auto& [record_key, record] : invoices->entries()) {
          // Nested buckets are reported with an empty value.
          if (record.empty()) {
            continue;
          }
          auto decoded = decode_invoice(encoder_, make_bytes_view(record));
          if (!decoded.ok()) {
            spdlog::error("Invoice record {} is malformed: {}",
                          to_hex(make_bytes_view(record_key)), decoded.log);
            return forward_error<std::vector<invoice_t>>(decoded);
          }
          if (pending_only && decoded.value->terms.settled) {
            continue;
          }
          out.push_back(std::move(*decoded.value));
        }
        return make_ok(std::move(out));
      });
}

status_t invoice_store::settle_invoice(const hash32_t& payment_hash) {
  auto result = storage_.update([&](transaction_t& txn) -> status_t {
    auto resolved = resolve_invoice(txn, payment_hash);
    if (!resolved.ok()) {
      return forward_error<std::monostate>(resolved);
    }
    auto& [invoices, id] = *resolved.value;

    auto invoice = fetch_invoice(encoder_, invoices, id);
    if (!invoice.ok()) {
      return forward_error<std::monostate>(invoice);
    }
    invoice.value->terms.settled = true;

    auto record_key = key::make_invoice_key(id);
    auto record = encode_invoice(encoder_, *invoice.value);
    invoices.put(make_bytes_view(record_key), make_bytes_view(record));
    return make_ok();
  });

  if (result.ok()) {
    spdlog::debug("Settled invoice for payment hash {}",
                  hash_to_hex(payment_hash));
  } else {
    spdlog::warn("Failed to settle invoice for payment hash {}: {}",
                 hash_to_hex(payment_hash), result.log);
  }
  return result;
}

}  // namespace invoicedb::store
