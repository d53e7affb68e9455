#pragma once
#include <invoicedb/schema/primitives.hpp>
#include <optional>
#include <span>

namespace invoicedb::schema::encoding {

// The encoding library is a build time choice: callers spell the tag once
// through an alias (see store::encoder_t) and everything below is written
// against this interface.
template <typename Library>
struct encoder {
  template <typename T>
  invoicedb::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, invoicedb::schema::bytes_t& out);

  template <typename T>
  T decode(const invoicedb::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const invoicedb::schema::bytes_view_t& bytes);
};

}  // namespace invoicedb::schema::encoding
