#pragma once

#include <invoicedb/schema/invoice_error_code.hpp>

#include <optional>
#include <string>
#include <utility>
#include <variant>

// Schema type: operation result.
// Envelope returned by every invoice store operation: an error code, a
// human-readable log line and the value on success.
namespace invoicedb::schema {

template <typename T>
struct operation_result final {
  invoice_error_code code{invoice_error_code::ok};
  std::string log;
  std::optional<T> value;

  bool ok() const { return code == invoice_error_code::ok; }
};

using status_t = operation_result<std::monostate>;

template <typename T>
operation_result<T> make_ok(T value) {
  return operation_result<T>{.code = invoice_error_code::ok,
                             .log = {},
                             .value = std::move(value)};
}

inline status_t make_ok() {
  return make_ok(std::monostate{});
}

template <typename T>
operation_result<T> make_error(const invoice_error_code code,
                               std::string log) {
  return operation_result<T>{
      .code = code, .log = std::move(log), .value = std::nullopt};
}

/// Re-type a failed result so it can be returned from an operation with a
/// different value type.
template <typename T, typename U>
operation_result<T> forward_error(const operation_result<U>& failed) {
  return make_error<T>(failed.code, failed.log);
}

}  // namespace invoicedb::schema
