#include <notary/crypto/secp256k1.hpp>
#include <notary/testing/common.hpp>
#include <gtest/gtest.h>

#include <algorithm>

namespace {

// secp256k1 group order.
const auto kOrder = notary::schema::amount_t{
    "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEBAAEDCE6AF48A03BBFD25E8CD0364141"};

notary::schema::hash32_t read_s(const notary::schema::signature_t& signature) {
  auto s = notary::schema::hash32_t{};
  std::copy(std::begin(signature) + 32, std::begin(signature) + 64,
            std::begin(s));
  return s;
}

void write_s(notary::schema::signature_t& signature,
             const notary::schema::hash32_t& s) {
  std::copy(std::begin(s), std::end(s), std::begin(signature) + 32);
}

}  // namespace

TEST(secp256k1, curve_is_available) {
  EXPECT_TRUE(notary::crypto::available());
}

TEST(secp256k1, seeded_keys_are_deterministic) {
  auto first = notary::testing::make_signer("alice");
  auto second = notary::testing::make_signer("alice");
  auto other = notary::testing::make_signer("bob");
  EXPECT_EQ(first.private_key, second.private_key);
  EXPECT_EQ(first.address, second.address);
  EXPECT_NE(first.address, other.address);
  EXPECT_FALSE(notary::schema::is_zero(first.address));
}

TEST(secp256k1, address_matches_public_key) {
  auto signer = notary::testing::make_signer("alice");
  auto public_key = notary::crypto::derive_public_key(signer.private_key);
  ASSERT_TRUE(public_key.has_value());
  EXPECT_EQ(notary::crypto::address_from_public_key(*public_key),
            signer.address);
}

TEST(secp256k1, sign_and_recover) {
  auto signer = notary::testing::make_signer("alice");
  auto digest = notary::testing::make_hash(7);
  auto signature = notary::crypto::sign_digest(signer.private_key, digest);
  ASSERT_TRUE(signature.has_value());
  EXPECT_LE((*signature)[64], 1);

  auto recovered = notary::crypto::recover_address(digest, *signature);
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, signer.address);
}

TEST(secp256k1, recovers_legacy_recovery_ids) {
  auto signer = notary::testing::make_signer("alice");
  auto digest = notary::testing::make_hash(9);
  auto signature = *notary::crypto::sign_digest(signer.private_key, digest);
  signature[64] = static_cast<uint8_t>(signature[64] + 27);

  auto recovered = notary::crypto::recover_address(digest, signature);
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(*recovered, signer.address);
}

TEST(secp256k1, rejects_bad_recovery_id) {
  auto signer = notary::testing::make_signer("alice");
  auto digest = notary::testing::make_hash(11);
  auto signature = *notary::crypto::sign_digest(signer.private_key, digest);
  signature[64] = 2;
  EXPECT_FALSE(notary::crypto::recover_address(digest, signature).has_value());
  signature[64] = 29;
  EXPECT_FALSE(notary::crypto::recover_address(digest, signature).has_value());
}

TEST(secp256k1, rejects_high_s) {
  auto signer = notary::testing::make_signer("alice");
  auto digest = notary::testing::make_hash(13);
  auto signature = *notary::crypto::sign_digest(signer.private_key, digest);

  auto s = notary::schema::from_word(read_s(signature));
  write_s(signature, notary::schema::to_word(kOrder - s));
  signature[64] ^= 1;
  EXPECT_FALSE(notary::crypto::recover_address(digest, signature).has_value());
}

TEST(secp256k1, rejects_zero_signature) {
  auto digest = notary::testing::make_hash(15);
  EXPECT_FALSE(notary::crypto::recover_address(digest,
                                               notary::schema::signature_t{})
                   .has_value());
}

TEST(secp256k1, other_digest_recovers_other_address) {
  auto signer = notary::testing::make_signer("alice");
  auto signature = *notary::crypto::sign_digest(signer.private_key,
                                                notary::testing::make_hash(1));
  auto recovered = notary::crypto::recover_address(
      notary::testing::make_hash(2), signature);
  if (recovered.has_value()) {
    EXPECT_NE(*recovered, signer.address);
  }
}

TEST(secp256k1, generated_keys_differ) {
  auto first = notary::crypto::generate_private_key();
  auto second = notary::crypto::generate_private_key();
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_NE(*first, *second);
  EXPECT_TRUE(notary::crypto::address_from_private_key(*first).has_value());
}

TEST(secp256k1, zero_private_key_is_rejected) {
  EXPECT_FALSE(notary::crypto::derive_public_key(notary::schema::private_key_t{})
                   .has_value());
}
