#include <gtest/gtest.h>
#include <invoicedb/crypto/sha256.hpp>
#include <invoicedb/testing/common.hpp>

namespace {

std::string hex(const invoicedb::schema::hash32_t& hash) {
  return invoicedb::schema::to_hex(
      invoicedb::schema::bytes_view_t{hash.data(), hash.size()});
}

}  // namespace

TEST(sha256, matches_known_digests) {
  EXPECT_EQ(hex(invoicedb::crypto::sha256(std::string_view{""})),
            "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  EXPECT_EQ(hex(invoicedb::crypto::sha256(std::string_view{"abc"})),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(sha256, payment_hash_digests_the_raw_preimage) {
  auto preimage = invoicedb::testing::make_preimage(0x10);
  auto expected = invoicedb::crypto::sha256(
      invoicedb::schema::bytes_view_t{preimage.data(), preimage.size()});
  EXPECT_EQ(invoicedb::crypto::payment_hash(preimage), expected);
}

TEST(sha256, zero_preimage_has_known_payment_hash) {
  auto preimage = invoicedb::schema::preimage_t{};
  EXPECT_EQ(hex(invoicedb::crypto::payment_hash(preimage)),
            "66687aadf862bd776c8fc18b8e9f8e20089714856ee233b3902a591d0d5f2925");
}

TEST(sha256, distinct_preimages_hash_differently) {
  EXPECT_NE(
      invoicedb::crypto::payment_hash(invoicedb::testing::make_preimage(1)),
      invoicedb::crypto::payment_hash(invoicedb::testing::make_preimage(2)));
}
