#pragma once

#include <invoicedb/schema/primitives.hpp>
#include <optional>
#include <string_view>

// Schema key type: invoice keys.
// Keyspace names and key codecs for the primary invoice records and the
// payment hash index nested beneath them.
namespace invoicedb::schema::key {

/// Primary keyspace: 4-byte big-endian identifier -> encoded invoice.
inline constexpr std::string_view kInvoiceBucket{"invoices"};

/// Nested under kInvoiceBucket: payment hash -> identifier, plus the
/// next identifier counter.
inline constexpr std::string_view kPaymentHashIndexBucket{"paymenthashes"};

/// Counter key inside kPaymentHashIndexBucket holding the next identifier to
/// assign.
inline constexpr std::string_view kNextInvoiceIdKey{"nik"};

inline constexpr std::size_t kInvoiceIdSize = sizeof(invoice_id_t);

invoicedb::schema::bytes_t make_invoice_key(invoice_id_t id);

/// Inverse of make_invoice_key; std::nullopt unless exactly 4 bytes.
std::optional<invoice_id_t> parse_invoice_key(
    const invoicedb::schema::bytes_view_t& key);

invoicedb::schema::bytes_t make_payment_hash_key(
    const invoicedb::schema::hash32_t& payment_hash);

invoicedb::schema::bytes_t make_next_invoice_id_key();

}  // namespace invoicedb::schema::key
