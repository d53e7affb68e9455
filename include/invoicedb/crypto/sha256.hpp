#pragma once

#include <invoicedb/schema/primitives.hpp>
#include <string_view>

namespace invoicedb::crypto {

/// SHA-256 digest; used to derive an invoice's payment hash from its
/// preimage.
invoicedb::schema::hash32_t sha256(const invoicedb::schema::bytes_view_t& bytes);
invoicedb::schema::hash32_t sha256(const std::string_view& str);

/// Payment hash of a 32-byte preimage.
invoicedb::schema::hash32_t payment_hash(
    const invoicedb::schema::preimage_t& preimage);

}  // namespace invoicedb::crypto
