#pragma once
#include <invoicedb/schema/encoding/scale/encoder.hpp>
#include <invoicedb/schema/invoice.hpp>
#include <invoicedb/schema/operation_result.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>

// Record codec for invoices stored in the primary keyspace.
//
// Layout, in order:
//   memo            SCALE compact length + bytes, at most kMaxMemoSize
//   receipt         SCALE compact length + bytes, at most kMaxReceiptSize
//   creation_time   SCALE compact length + timestamp bytes, at most
//                   kMaxTimestampSize
//   preimage        32 raw bytes
//   value           8 bytes, big-endian two's complement of the amount
//   settled         1 byte, 1 means settled and anything else does not
namespace invoicedb::schema::encoding::scale {

inline constexpr std::size_t kMaxTimestampSize = 300;
inline constexpr uint8_t kTimestampVersion = 1;
inline constexpr std::size_t kTimestampSize = 13;

/// Version byte, then SCALE int64 seconds and uint32 nanoseconds since the
/// Unix epoch.
invoicedb::schema::bytes_t encode_timestamp(
    encoder<scale_encoder_tag>& encoder,
    const invoicedb::schema::timestamp_t& timestamp);

std::optional<invoicedb::schema::timestamp_t> decode_timestamp(
    encoder<scale_encoder_tag>& encoder,
    const invoicedb::schema::bytes_view_t& bytes);

invoicedb::schema::bytes_t encode_invoice(
    encoder<scale_encoder_tag>& encoder,
    const invoicedb::schema::invoice_t& invoice);

/// Fails with malformed_record on an oversized field, truncated input or an
/// unparsable timestamp.
invoicedb::schema::operation_result<invoicedb::schema::invoice_t>
decode_invoice(encoder<scale_encoder_tag>& encoder,
               const invoicedb::schema::bytes_view_t& bytes);

}  // namespace invoicedb::schema::encoding::scale
