#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/key/engine_keys.hpp>
#include <notary/schema/transaction.hpp>
#include <notary/schema/transaction_error_code.hpp>
#include <notary/testing/common.hpp>
#include <gtest/gtest.h>

#include <set>
#include <string>
#include <tuple>

namespace {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

}  // namespace

TEST(encoding, assertion_record_round_trips) {
  auto encoder = encoder_t{};
  auto record = notary::schema::assertion_record_t{
      .text = "over 18",
      .assertion_id = notary::testing::make_hash(1),
      .revoke_id = notary::testing::make_hash(2),
      .freshness_window = 3600,
      .expiry_window = 86400,
      .requires_gateway = true,
      .gateway = notary::testing::make_address(3),
      .controller = notary::testing::make_address(4),
      .stopped = true};
  auto encoded = encoder.encode(record);
  auto decoded = encoder.decode<notary::schema::assertion_record_t>(
      notary::schema::make_bytes_view(encoded));
  EXPECT_EQ(decoded.text, record.text);
  EXPECT_EQ(decoded.assertion_id, record.assertion_id);
  EXPECT_EQ(decoded.revoke_id, record.revoke_id);
  EXPECT_EQ(decoded.freshness_window, record.freshness_window);
  EXPECT_EQ(decoded.expiry_window, record.expiry_window);
  EXPECT_TRUE(decoded.requires_gateway);
  EXPECT_EQ(decoded.gateway, record.gateway);
  EXPECT_EQ(decoded.controller, record.controller);
  EXPECT_TRUE(decoded.stopped);
}

TEST(encoding, role_state_keeps_wide_tip_amount) {
  auto encoder = encoder_t{};
  auto roles = notary::schema::role_state_t{
      .owner = notary::testing::make_address(1),
      .overrider = notary::testing::make_address(2),
      .tip_jar = notary::testing::make_address(3),
      .tip_amount = notary::schema::amount_t{"340282366920938463463374607431768211457"}};
  auto encoded = encoder.encode(roles);
  auto decoded = encoder.decode<notary::schema::role_state_t>(
      notary::schema::make_bytes_view(encoded));
  EXPECT_EQ(decoded.owner, roles.owner);
  EXPECT_EQ(decoded.overrider, roles.overrider);
  EXPECT_EQ(decoded.tip_jar, roles.tip_jar);
  EXPECT_EQ(decoded.tip_amount, roles.tip_amount);
}

TEST(encoding, transaction_payloads_keep_their_alternative) {
  auto encoder = encoder_t{};
  auto tx = notary::schema::transaction_t{
      .chain_id = notary::testing::make_hash(9),
      .nonce = 7,
      .sender = notary::testing::make_address(5),
      .value = 12,
      .payload = notary::schema::safe_batch_transfer_from_t{
          .from = notary::testing::make_address(6),
          .to = notary::testing::make_address(7),
          .ids = {notary::testing::make_hash(1), notary::testing::make_hash(2)},
          .amounts = {1, 2},
          .data = {0xAA}}};
  tx.signature[0] = 0x42;
  auto encoded = encoder.encode(tx);
  auto decoded = encoder.decode<notary::schema::transaction_t>(
      notary::schema::make_bytes_view(encoded));
  EXPECT_EQ(decoded.version, 1);
  EXPECT_EQ(decoded.chain_id, tx.chain_id);
  EXPECT_EQ(decoded.nonce, 7u);
  EXPECT_EQ(decoded.sender, tx.sender);
  EXPECT_EQ(decoded.value, notary::schema::amount_t{12});
  EXPECT_EQ(decoded.signature, tx.signature);
  ASSERT_TRUE(std::holds_alternative<notary::schema::safe_batch_transfer_from_t>(
      decoded.payload));
  const auto& batch =
      std::get<notary::schema::safe_batch_transfer_from_t>(decoded.payload);
  ASSERT_EQ(batch.amounts.size(), 2u);
  EXPECT_EQ(batch.amounts[1], notary::schema::amount_t{2});
  EXPECT_EQ(batch.ids[0], notary::testing::make_hash(1));
}

TEST(encoding, truncated_transaction_fails_to_decode) {
  auto encoder = encoder_t{};
  auto tx = notary::schema::transaction_t{
      .payload = notary::schema::add_assertion_t{.text = "over 18"}};
  auto encoded = encoder.encode(tx);
  encoded.resize(encoded.size() / 2);
  EXPECT_FALSE(encoder
                   .try_decode<notary::schema::transaction_t>(
                       notary::schema::make_bytes_view(encoded))
                   .has_value());
}

TEST(encoding, state_keys_are_distinct_and_prefixed) {
  auto encoder = encoder_t{};
  auto id = notary::testing::make_hash(1);
  auto address = notary::testing::make_address(2);
  auto keys = std::set<notary::schema::bytes_t>{
      notary::schema::key::make_nonce_key(encoder, address),
      notary::schema::key::make_role_state_key(encoder),
      notary::schema::key::make_tip_balance_key(encoder),
      notary::schema::key::make_assertion_key(encoder, id),
      notary::schema::key::make_assertion_list_key(encoder, 0),
      notary::schema::key::make_assertion_list_key(encoder, 1),
      notary::schema::key::make_assertion_list_state_key(encoder),
      notary::schema::key::make_attestation_key(encoder, id, address),
      notary::schema::key::make_blocklist_key(encoder, address)};
  EXPECT_EQ(keys.size(), 9u);

  auto expected = encoder.encode(std::tuple{
      std::string{notary::schema::key::kAttestationKeyPrefix}, id, address});
  EXPECT_EQ(notary::schema::key::make_attestation_key(encoder, id, address),
            expected);
}

TEST(encoding, error_codes_map_to_categories) {
  using notary::schema::error_category;
  using notary::schema::transaction_error_code;
  EXPECT_EQ(notary::schema::category_of(transaction_error_code::invalid_nonce),
            error_category::envelope);
  EXPECT_EQ(
      notary::schema::category_of(transaction_error_code::duplicate_assertion),
      error_category::validation);
  EXPECT_EQ(
      notary::schema::category_of(transaction_error_code::gateway_required),
      error_category::not_authorized);
  EXPECT_EQ(notary::schema::category_of(transaction_error_code::address_blocked),
            error_category::state);
  EXPECT_EQ(
      notary::schema::category_of(transaction_error_code::signature_expired),
      error_category::signature);
  EXPECT_EQ(
      notary::schema::category_of(transaction_error_code::transfer_failed),
      error_category::transfer);
  EXPECT_EQ(notary::schema::to_string(transaction_error_code::not_transferable),
            "not_transferable");
  EXPECT_EQ(notary::schema::to_string(error_category::insufficient_tip),
            "insufficient_tip");
}
