#pragma once

#include <invoicedb/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: invoice error code.
// Stable numeric codes for every failure an invoice store operation reports.
namespace invoicedb::schema {

enum class invoice_error_code : uint32_t {
  ok = 0,
  invalid_invoice = 1,
  duplicate_invoice = 2,
  invoice_not_found = 3,
  no_invoices_created = 4,
  malformed_record = 5,
  duplicate_payment_hash = 6,
  identifier_exhausted = 7,
};

inline constexpr auto kInvoiceErrorCodeNames =
    std::array<std::pair<std::string_view, invoice_error_code>, 8>{{
        {"ok", invoice_error_code::ok},
        {"invalid_invoice", invoice_error_code::invalid_invoice},
        {"duplicate_invoice", invoice_error_code::duplicate_invoice},
        {"invoice_not_found", invoice_error_code::invoice_not_found},
        {"no_invoices_created", invoice_error_code::no_invoices_created},
        {"malformed_record", invoice_error_code::malformed_record},
        {"duplicate_payment_hash", invoice_error_code::duplicate_payment_hash},
        {"identifier_exhausted", invoice_error_code::identifier_exhausted},
    }};

constexpr std::string_view to_string(const invoice_error_code value) {
  return to_string(value, kInvoiceErrorCodeNames).value_or("unknown");
}

template <>
inline std::optional<invoice_error_code> try_from_string<invoice_error_code>(
    const std::string_view value) {
  return from_string(value, kInvoiceErrorCodeNames);
}

}  // namespace invoicedb::schema
