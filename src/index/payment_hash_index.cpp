#include <invoicedb/index/payment_hash_index.hpp>
#include <invoicedb/schema/key/invoice_keys.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <limits>
#include <utility>

using namespace invoicedb::schema;

namespace invoicedb::index {

payment_hash_index::payment_hash_index(bucket_t index_bucket)
    : bucket_{std::move(index_bucket)} {}

operation_result<invoice_id_t> payment_hash_index::next_identifier() const {
  auto counter_key = key::make_next_invoice_id_key();
  auto counter = bucket_.get(make_bytes_view(counter_key));
  if (!counter) {
    return make_ok(invoice_id_t{0});
  }
  auto next = key::parse_invoice_key(make_bytes_view(*counter));
  if (!next) {
    spdlog::error("Invoice counter holds {} bytes", counter->size());
    return make_error<invoice_id_t>(
        invoice_error_code::malformed_record,
        fmt::format("invoice counter of {} bytes, expected {}",
                    counter->size(), key::kInvoiceIdSize));
  }
  return make_ok(*next);
}

status_t payment_hash_index::reserve(const hash32_t& payment_hash,
                                     const invoice_id_t id) {
  auto hash_key = key::make_payment_hash_key(payment_hash);
  if (bucket_.get(make_bytes_view(hash_key))) {
    return make_error<std::monostate>(
        invoice_error_code::duplicate_payment_hash,
        fmt::format("payment hash {} is already indexed",
                    to_hex(make_bytes_view(hash_key))));
  }
  auto id_value = key::make_invoice_key(id);
  bucket_.put(make_bytes_view(hash_key), make_bytes_view(id_value));
  return make_ok();
}

status_t payment_hash_index::advance_counter(const invoice_id_t id) {
  if (id == std::numeric_limits<invoice_id_t>::max()) {
    return make_error<std::monostate>(
        invoice_error_code::identifier_exhausted,
        fmt::format("invoice identifier {} is the last one available", id));
  }
  auto counter_key = key::make_next_invoice_id_key();
  auto counter_value = key::make_invoice_key(id + 1);
  bucket_.put(make_bytes_view(counter_key), make_bytes_view(counter_value));
  return make_ok();
}

operation_result<invoice_id_t> payment_hash_index::resolve(
    const hash32_t& payment_hash) const {
  auto hash_key = key::make_payment_hash_key(payment_hash);
  auto value = bucket_.get(make_bytes_view(hash_key));
  if (!value) {
    return make_error<invoice_id_t>(
        invoice_error_code::invoice_not_found,
        fmt::format("no invoice for payment hash {}",
                    to_hex(make_bytes_view(hash_key))));
  }
  auto id = key::parse_invoice_key(make_bytes_view(*value));
  if (!id) {
    spdlog::error("Index entry for payment hash {} holds {} bytes",
                  to_hex(make_bytes_view(hash_key)), value->size());
    return make_error<invoice_id_t>(
        invoice_error_code::malformed_record,
        fmt::format("index entry of {} bytes, expected {}", value->size(),
                    key::kInvoiceIdSize));
  }
  return make_ok(*id);
}

}  // namespace invoicedb::index
