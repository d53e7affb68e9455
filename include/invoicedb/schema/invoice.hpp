#pragma once

#include <invoicedb/schema/contract_term.hpp>
#include <invoicedb/schema/primitives.hpp>
#include <cstddef>
#include <cstdint>

// Schema type: invoice.
// Payment request created by a payee. Invoices are never deleted; settling
// one only flips terms.settled.
namespace invoicedb::schema {

inline constexpr std::size_t kMaxMemoSize = 1024;
inline constexpr std::size_t kMaxReceiptSize = 1024;

template <uint16_t Version>
struct invoice;

template <>
struct invoice<1> final {
  bytes_t memo;
  bytes_t receipt;
  timestamp_t creation_time{};
  contract_term_t terms;

  bool operator==(const invoice&) const = default;
};

using invoice_t = invoice<1>;

}  // namespace invoicedb::schema
