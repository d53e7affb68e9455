#pragma once

#include <invoicedb/schema/invoice.hpp>
#include <invoicedb/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace invoicedb::testing {

inline invoicedb::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = invoicedb::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline invoicedb::schema::preimage_t make_preimage(const uint8_t seed) {
  return make_hash(seed);
}

inline invoicedb::schema::timestamp_t make_timestamp(const int64_t seconds,
                                                     const uint32_t nanos = 0) {
  return invoicedb::schema::timestamp_t{std::chrono::seconds{seconds} +
                                        std::chrono::nanoseconds{nanos}};
}

inline invoicedb::schema::invoice_t make_invoice(
    const uint8_t seed,
    const invoicedb::schema::amount_t value,
    const std::string_view memo = {}) {
  auto invoice = invoicedb::schema::invoice_t{};
  invoice.memo = invoicedb::schema::make_bytes(memo);
  invoice.creation_time = make_timestamp(1'700'000'000 + seed, 250);
  invoice.terms.payment_preimage = make_preimage(seed);
  invoice.terms.value = value;
  return invoice;
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace invoicedb::testing
