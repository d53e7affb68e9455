#include <invoicedb/schema/key/builder.hpp>
#include <invoicedb/schema/key/invoice_keys.hpp>

#include <boost/endian/conversion.hpp>

using namespace invoicedb::schema;

namespace invoicedb::schema::key {

bytes_t make_invoice_key(const invoice_id_t id) {
  auto b = builder{};
  b.write(id);
  return b.data;
}

std::optional<invoice_id_t> parse_invoice_key(const bytes_view_t& key) {
  if (key.size() != kInvoiceIdSize) {
    return std::nullopt;
  }
  return boost::endian::load_big_u32(key.data());
}

bytes_t make_payment_hash_key(const hash32_t& payment_hash) {
  auto b = builder{};
  b.write(std::span(payment_hash.data(), payment_hash.size()));
  return b.data;
}

bytes_t make_next_invoice_id_key() {
  auto b = builder{};
  b.write(kNextInvoiceIdKey);
  return b.data;
}

}  // namespace invoicedb::schema::key
