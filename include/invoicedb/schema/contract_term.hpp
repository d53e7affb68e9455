#pragma once

#include <invoicedb/schema/primitives.hpp>
#include <cstdint>

// Schema type: contract term.
// Settlement conditions of an invoice: the preimage whose hash identifies
// it, the amount expected and whether it has been paid.
namespace invoicedb::schema {

template <uint16_t Version>
struct contract_term;

template <>
struct contract_term<1> final {
  preimage_t payment_preimage{};
  amount_t value{};
  bool settled{false};

  bool operator==(const contract_term&) const = default;
};

using contract_term_t = contract_term<1>;

}  // namespace invoicedb::schema
