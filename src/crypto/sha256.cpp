#include <invoicedb/common/critical.hpp>
#include <invoicedb/crypto/sha256.hpp>

#include <openssl/evp.h>

#include <memory>

namespace invoicedb::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

invoicedb::schema::hash32_t digest(const void* data, const std::size_t size) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    invoicedb::common::critical("failed to allocate EVP_MD_CTX");
  }

  auto output = invoicedb::schema::hash32_t{};
  auto written = 0u;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), output.data(), &written) != 1) {
    invoicedb::common::critical("SHA-256 digest failed");
  }
  if (written != output.size()) {
    invoicedb::common::critical("SHA-256 digest has unexpected length");
  }
  return output;
}

}  // namespace

invoicedb::schema::hash32_t sha256(
    const invoicedb::schema::bytes_view_t& bytes) {
  return digest(bytes.data(), bytes.size());
}

invoicedb::schema::hash32_t sha256(const std::string_view& str) {
  return digest(str.data(), str.size());
}

invoicedb::schema::hash32_t payment_hash(
    const invoicedb::schema::preimage_t& preimage) {
  return sha256(
      invoicedb::schema::bytes_view_t{preimage.data(), preimage.size()});
}

}  // namespace invoicedb::crypto
