#include <notary/crypto/verify.hpp>
#include <notary/execution/assertion_registry.hpp>
#include <notary/execution/engine.hpp>
#include <notary/schema/query_error_code.hpp>
#include <notary/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <string>
#include <tuple>

using notary::schema::transaction_error_code;
namespace registry = notary::execution::assertion_registry;

namespace {

constexpr auto kBlockTime = notary::schema::timestamp_seconds_t{1'000'000};

uint32_t code_of(transaction_error_code code) {
  return static_cast<uint32_t>(code);
}

notary::schema::add_assertion_t make_add(const std::string& text) {
  return notary::schema::add_assertion_t{
      .text = text, .freshness_window = 3600, .expiry_window = 86400};
}

template <typename T>
T decode_query(notary::testing::execution_fixture& fixture,
               const std::string& path,
               const notary::schema::bytes_t& key = {}) {
  auto result = fixture.engine().query(path, notary::schema::make_bytes_view(key));
  EXPECT_EQ(result.code, 0u) << result.log;
  return fixture.encoder().decode<T>(
      notary::schema::make_bytes_view(result.value));
}

}  // namespace

TEST(engine, genesis_sets_roles) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_genesis"};
  auto roles = decode_query<notary::schema::role_state_t>(fixture, "/roles");
  EXPECT_EQ(roles.owner, fixture.owner().address);
  EXPECT_EQ(roles.overrider, fixture.overrider().address);
  EXPECT_EQ(roles.tip_jar, fixture.tip_jar().address);

  auto info = fixture.engine().info();
  EXPECT_EQ(info.last_block_height, 0);
  EXPECT_EQ(info.chain_id, notary::testing::kChainId);
  EXPECT_EQ(info.registry_address, notary::testing::kRegistryAddress);
  EXPECT_EQ(info.data, "notary-registry");
}

TEST(engine, genesis_defaults_tip_jar_to_owner) {
  auto db = notary::testing::make_db_path("notary_engine_defaults");
  {
    auto encoder = notary::execution::encoder_t{};
    auto storage =
        notary::storage::make_storage<notary::storage::rocksdb_storage_tag>(db);
    auto rail = notary::testing::recording_payment_rail{};
    auto owner = notary::testing::make_address(1);
    auto engine = notary::execution::engine{
        encoder, storage,
        notary::execution::genesis_config{.chain_id = notary::testing::kChainId,
                                          .owner = owner},
        rail};
    auto result = engine.query("/roles", {});
    ASSERT_EQ(result.code, 0u);
    auto roles = encoder.decode<notary::schema::role_state_t>(
        notary::schema::make_bytes_view(result.value));
    EXPECT_EQ(roles.tip_jar, owner);
    EXPECT_TRUE(notary::schema::is_zero(roles.overrider));
  }
  notary::testing::remove_path(db);
}

TEST(engine, add_assertion_commits_and_is_queryable) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_add"};
  auto publisher = notary::testing::make_signer("publisher");
  auto result = fixture.run(fixture.make_tx(publisher, 1, make_add("over 18")));
  ASSERT_EQ(result.code, 0u) << result.log;
  ASSERT_EQ(result.events.size(), 2u);
  EXPECT_EQ(result.events[0].type, "AssertionAdded");

  auto encoder = notary::execution::encoder_t{};
  auto id = registry::assertion_id_of("over 18");
  auto record = decode_query<notary::schema::assertion_record_t>(
      fixture, "/assertion/get", encoder.encode(id));
  EXPECT_EQ(record.text, "over 18");
  EXPECT_EQ(decode_query<notary::schema::assertion_id_t>(
                fixture, "/assertion/at", encoder.encode(uint64_t{0})),
            id);
  auto list =
      decode_query<notary::schema::assertion_list_state_t>(fixture,
                                                           "/assertion/list_state");
  EXPECT_EQ(list.count, 1u);
  EXPECT_EQ(list.last_update, kBlockTime);
  EXPECT_EQ(decode_query<uint64_t>(fixture, "/nonce",
                                   encoder.encode(publisher.address)),
            2u);
  EXPECT_EQ(fixture.engine().info().last_block_height, 1);
}

TEST(engine, nonce_must_match_exactly_in_blocks) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_nonce"};
  auto publisher = notary::testing::make_signer("publisher");
  auto result = fixture.run(fixture.make_tx(publisher, 2, make_add("a")));
  EXPECT_EQ(result.code, code_of(transaction_error_code::invalid_nonce));
  EXPECT_EQ(result.codespace, "notary.envelope");
  EXPECT_EQ(result.log, "invalid_nonce");

  EXPECT_EQ(fixture.run(fixture.make_tx(publisher, 1, make_add("a"))).code, 0u);
  result = fixture.run(fixture.make_tx(publisher, 1, make_add("b")));
  EXPECT_EQ(result.code, code_of(transaction_error_code::invalid_nonce));
}

TEST(engine, check_transaction_admits_future_nonce) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_check"};
  auto publisher = notary::testing::make_signer("publisher");
  auto future = fixture.encode(fixture.make_tx(publisher, 5, make_add("a")));
  EXPECT_EQ(fixture.engine()
                .check_transaction(notary::schema::make_bytes_view(future))
                .code,
            0u);

  auto garbage = notary::schema::bytes_t{0x01, 0x02};
  auto result =
      fixture.engine().check_transaction(notary::schema::make_bytes_view(garbage));
  EXPECT_EQ(result.code, code_of(transaction_error_code::invalid_transaction));

  auto paid = fixture.encode(fixture.make_tx(
      publisher, 1, notary::schema::tip_out_t{}, notary::schema::amount_t{1}));
  result = fixture.engine().check_transaction(notary::schema::make_bytes_view(paid));
  EXPECT_EQ(result.code, code_of(transaction_error_code::non_payable));
}

TEST(engine, rejects_wrong_chain_version_and_sender) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_envelope"};
  auto publisher = notary::testing::make_signer("publisher");

  auto tx = fixture.make_tx(publisher, 1, make_add("a"));
  tx.chain_id = notary::testing::make_hash(1);
  EXPECT_EQ(fixture.run(tx).code,
            code_of(transaction_error_code::invalid_chain_id));

  tx = fixture.make_tx(publisher, 1, make_add("a"));
  tx.version = 2;
  EXPECT_EQ(fixture.run(tx).code,
            code_of(transaction_error_code::unsupported_transaction_version));

  tx = fixture.make_tx(publisher, 1, make_add("a"));
  tx.sender = notary::schema::make_zero_address();
  EXPECT_EQ(fixture.run(tx).code,
            code_of(transaction_error_code::invalid_sender));
}

TEST(engine, strict_crypto_checks_envelope_signature) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_strict"};
  auto publisher = notary::testing::make_signer("publisher");
  auto impostor = notary::testing::make_signer("impostor");

  auto tx = fixture.make_tx(publisher, 1, make_add("a"));
  tx.sender = impostor.address;
  EXPECT_EQ(fixture.run(tx).code,
            code_of(transaction_error_code::signature_verification_failed));

  tx = fixture.make_tx(publisher, 1, make_add("a"));
  tx.nonce = 1;
  tx.payload = make_add("b");
  EXPECT_EQ(fixture.run(tx).code,
            code_of(transaction_error_code::signature_verification_failed));
}

TEST(engine, relaxed_crypto_trusts_sender) {
  auto fixture =
      notary::testing::execution_fixture{"notary_engine_relaxed", false};
  auto tx = notary::schema::transaction_t{
      .chain_id = notary::testing::kChainId,
      .nonce = 1,
      .sender = notary::testing::make_address(3),
      .payload = make_add("a")};
  EXPECT_EQ(fixture.run(tx).code, 0u);
}

TEST(engine, value_on_non_payable_operation_fails) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_payable"};
  auto owner = fixture.owner();
  auto result = fixture.run(fixture.make_tx(
      owner, 1, notary::schema::set_tip_amount_t{.tip_amount = 3},
      notary::schema::amount_t{5}));
  EXPECT_EQ(result.code, code_of(transaction_error_code::non_payable));
  EXPECT_EQ(result.codespace, "notary.validation");

  result = fixture.run(fixture.make_tx(owner, 2, notary::schema::deposit_t{},
                                       notary::schema::amount_t{5}));
  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(notary::schema::from_word(
                decode_query<notary::schema::hash32_t>(fixture, "/tips/balance")),
            notary::schema::amount_t{5});
}

TEST(engine, failed_operation_consumes_nonce_and_leaves_no_state) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_atomic"};
  auto owner = fixture.owner();
  ASSERT_EQ(fixture.run(fixture.make_tx(
                            owner, 1,
                            notary::schema::set_tip_amount_t{.tip_amount = 100}))
                .code,
            0u);

  auto publisher = notary::testing::make_signer("publisher");
  auto result = fixture.run(fixture.make_tx(publisher, 1, make_add("over 18"),
                                            notary::schema::amount_t{50}));
  EXPECT_EQ(result.code, code_of(transaction_error_code::insufficient_tip));
  EXPECT_TRUE(result.events.empty());

  auto encoder = notary::execution::encoder_t{};
  auto missing = fixture.engine().query(
      "/assertion/get",
      notary::schema::make_bytes_view(
          encoder.encode(registry::assertion_id_of("over 18"))));
  EXPECT_EQ(missing.code,
            static_cast<uint32_t>(notary::schema::query_error_code::not_found));
  EXPECT_EQ(decode_query<uint64_t>(fixture, "/nonce",
                                   encoder.encode(publisher.address)),
            2u);

  result = fixture.run(fixture.make_tx(publisher, 2, make_add("over 18"),
                                       notary::schema::amount_t{100}));
  EXPECT_EQ(result.code, 0u);
}

TEST(engine, tip_out_pays_only_after_commit) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_tip_out"};
  auto publisher = notary::testing::make_signer("publisher");
  ASSERT_EQ(fixture.run(fixture.make_tx(publisher, 1, notary::schema::deposit_t{},
                                        notary::schema::amount_t{9}))
                .code,
            0u);
  ASSERT_EQ(fixture.rail().collections.size(), 1u);
  EXPECT_EQ(fixture.rail().collections[0].first, publisher.address);

  auto block = fixture.engine().finalize_block(
      fixture.next_height(), kBlockTime,
      {fixture.encode(fixture.make_tx(publisher, 2, notary::schema::tip_out_t{}))});
  ASSERT_EQ(block.tx_results.front().code, 0u);
  EXPECT_TRUE(fixture.rail().transfers.empty());

  fixture.engine().commit();
  ASSERT_EQ(fixture.rail().transfers.size(), 1u);
  EXPECT_EQ(fixture.rail().transfers[0].first, fixture.tip_jar().address);
  EXPECT_EQ(fixture.rail().transfers[0].second, notary::schema::amount_t{9});
  EXPECT_EQ(notary::schema::from_word(
                decode_query<notary::schema::hash32_t>(fixture, "/tips/balance")),
            notary::schema::amount_t{0});
}

TEST(engine, reproposed_block_pays_tip_out_once) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_repropose"};
  auto publisher = notary::testing::make_signer("publisher");
  ASSERT_EQ(fixture.run(fixture.make_tx(publisher, 1, notary::schema::deposit_t{},
                                        notary::schema::amount_t{9}))
                .code,
            0u);

  auto tx = fixture.encode(fixture.make_tx(publisher, 2, notary::schema::tip_out_t{}));
  auto height = fixture.next_height();
  fixture.engine().finalize_block(height, kBlockTime, {tx});
  fixture.engine().finalize_block(height, kBlockTime, {tx});
  fixture.engine().commit();

  ASSERT_EQ(fixture.rail().transfers.size(), 1u);
  EXPECT_EQ(fixture.rail().transfers[0].second, notary::schema::amount_t{9});

  fixture.engine().commit();
  EXPECT_EQ(fixture.rail().transfers.size(), 1u);
}

TEST(engine, refused_payout_is_retried_on_next_commit) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_retry"};
  auto publisher = notary::testing::make_signer("publisher");
  ASSERT_EQ(fixture.run(fixture.make_tx(publisher, 1, notary::schema::deposit_t{},
                                        notary::schema::amount_t{9}))
                .code,
            0u);

  fixture.rail().accept_transfers = false;
  auto result =
      fixture.run(fixture.make_tx(publisher, 2, notary::schema::tip_out_t{}));
  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(fixture.rail().refused_transfers, 1u);
  EXPECT_TRUE(fixture.rail().transfers.empty());
  EXPECT_EQ(notary::schema::from_word(
                decode_query<notary::schema::hash32_t>(fixture, "/tips/balance")),
            notary::schema::amount_t{0});

  fixture.rail().accept_transfers = true;
  fixture.engine().commit();
  ASSERT_EQ(fixture.rail().transfers.size(), 1u);
  EXPECT_EQ(fixture.rail().transfers[0].first, fixture.tip_jar().address);
  EXPECT_EQ(fixture.rail().transfers[0].second, notary::schema::amount_t{9});
}

TEST(engine, unconfirmed_value_is_not_credited) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_collect"};
  auto publisher = notary::testing::make_signer("publisher");
  fixture.rail().accept_collections = false;

  auto large = notary::schema::amount_t{"1000000000000000000000000000000"};
  auto result = fixture.run(
      fixture.make_tx(publisher, 1, notary::schema::deposit_t{}, large));
  EXPECT_EQ(result.code, code_of(transaction_error_code::transfer_failed));
  EXPECT_EQ(result.codespace, "notary.transfer");
  result = fixture.run(fixture.make_tx(publisher, 2, make_add("over 18"), large));
  EXPECT_EQ(result.code, code_of(transaction_error_code::transfer_failed));

  EXPECT_EQ(notary::schema::from_word(
                decode_query<notary::schema::hash32_t>(fixture, "/tips/balance")),
            notary::schema::amount_t{0});
  auto list = decode_query<notary::schema::assertion_list_state_t>(
      fixture, "/assertion/list_state");
  EXPECT_EQ(list.count, 0u);

  result = fixture.run(fixture.make_tx(publisher, 3, notary::schema::tip_out_t{}));
  EXPECT_EQ(result.code, 0u);
  EXPECT_TRUE(fixture.rail().transfers.empty());
}

TEST(engine, attestation_flow_through_queries) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_attest"};
  auto publisher = notary::testing::make_signer("publisher");
  auto subject = notary::testing::make_signer("subject");
  ASSERT_EQ(fixture.run(fixture.make_tx(publisher, 1, make_add("over 18"))).code,
            0u);

  auto id = registry::assertion_id_of("over 18");
  auto signed_at = kBlockTime - 10;
  auto attest = notary::schema::attest_t{
      .assertion_id = id,
      .subject = subject.address,
      .signed_at = signed_at,
      .signature = *notary::crypto::sign_attestation(
          fixture.engine().domain(), "over 18", signed_at,
          subject.private_key)};
  auto result = fixture.run(fixture.make_tx(subject, 1, attest));
  ASSERT_EQ(result.code, 0u) << result.info;

  auto encoder = notary::execution::encoder_t{};
  auto pair_key = encoder.encode(std::tuple{id, subject.address});
  EXPECT_TRUE(decode_query<bool>(fixture, "/attestation/is_attested", pair_key));
  EXPECT_FALSE(decode_query<bool>(fixture, "/attestation/is_expired", pair_key));
  auto record = decode_query<notary::schema::attestation_record_t>(
      fixture, "/attestation/get", pair_key);
  EXPECT_EQ(record.signed_at, signed_at);
  EXPECT_EQ(decode_query<uint64_t>(
                fixture, "/token/balance_of",
                encoder.encode(std::tuple{subject.address, id})),
            1u);

  auto blocked = fixture.run(fixture.make_tx(
      fixture.overrider(), 1,
      notary::schema::block_address_t{.address = subject.address}));
  ASSERT_EQ(blocked.code, 0u);
  EXPECT_TRUE(decode_query<bool>(fixture, "/address/is_blocked",
                                 encoder.encode(subject.address)));
  EXPECT_FALSE(decode_query<bool>(fixture, "/attestation/is_attested", pair_key));

  auto never = encoder.encode(std::tuple{id, publisher.address});
  auto empty = decode_query<notary::schema::attestation_record_t>(
      fixture, "/attestation/get", never);
  EXPECT_EQ(empty.signed_at, 0u);
  EXPECT_FALSE(empty.revoked);
}

TEST(engine, token_surface_is_not_transferable) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_token"};
  auto holder = notary::testing::make_signer("holder");
  auto result = fixture.run(fixture.make_tx(
      holder, 1,
      notary::schema::safe_transfer_from_t{
          .from = holder.address, .to = notary::testing::make_address(2)}));
  EXPECT_EQ(result.code, code_of(transaction_error_code::not_transferable));
  result = fixture.run(fixture.make_tx(
      holder, 2, notary::schema::safe_batch_transfer_from_t{
                     .from = holder.address,
                     .to = notary::testing::make_address(2)}));
  EXPECT_EQ(result.code, code_of(transaction_error_code::not_transferable));
  result = fixture.run(fixture.make_tx(
      holder, 3, notary::schema::set_approval_for_all_t{.approved = true}));
  EXPECT_EQ(result.code, code_of(transaction_error_code::not_transferable));
  EXPECT_EQ(result.codespace, "notary.not_transferable");

  auto query = fixture.engine().query("/token/is_approved_for_all", {});
  EXPECT_EQ(query.code, static_cast<uint32_t>(
                            notary::schema::query_error_code::not_transferable));
}

TEST(engine, query_reports_bad_paths_and_keys) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_query"};
  auto result = fixture.engine().query("/nope", {});
  EXPECT_EQ(result.code, static_cast<uint32_t>(
                             notary::schema::query_error_code::unsupported_path));
  EXPECT_EQ(result.codespace, "notary.query");

  auto short_key = notary::schema::bytes_t{0x01};
  result = fixture.engine().query("/assertion/get",
                                  notary::schema::make_bytes_view(short_key));
  EXPECT_EQ(result.code, static_cast<uint32_t>(
                             notary::schema::query_error_code::invalid_key));
}

TEST(engine, state_root_is_deterministic_and_survives_restart) {
  auto first = notary::testing::execution_fixture{"notary_engine_root_a"};
  auto second = notary::testing::execution_fixture{"notary_engine_root_b"};
  auto publisher = notary::testing::make_signer("publisher");

  auto block = [&](notary::testing::execution_fixture& fixture) {
    auto txs = std::vector<notary::schema::bytes_t>{
        fixture.encode(fixture.make_tx(publisher, 1, make_add("a"))),
        fixture.encode(fixture.make_tx(publisher, 1, make_add("b"))),
        fixture.encode(fixture.make_tx(publisher, 2, make_add("c")))};
    auto result = fixture.engine().finalize_block(1, kBlockTime, txs);
    EXPECT_EQ(result.tx_results.size(), 3u);
    EXPECT_EQ(result.tx_results[1].code,
              code_of(transaction_error_code::invalid_nonce));
    return std::pair{result.state_root, fixture.engine().commit()};
  };

  auto [root_a, commit_a] = block(first);
  auto [root_b, commit_b] = block(second);
  EXPECT_EQ(root_a, root_b);
  EXPECT_NE(root_a, notary::schema::make_zero_hash());
  EXPECT_EQ(commit_a.committed_height, 1);
  EXPECT_EQ(commit_a.state_root, root_a);

  first.reopen();
  auto info = first.engine().info();
  EXPECT_EQ(info.last_block_height, 1);
  EXPECT_EQ(info.last_block_time, kBlockTime);
  EXPECT_EQ(info.last_block_state_root, root_a);
  auto list = decode_query<notary::schema::assertion_list_state_t>(
      first, "/assertion/list_state");
  EXPECT_EQ(list.count, 2u);
}

TEST(engine, uncommitted_block_is_not_visible) {
  auto fixture = notary::testing::execution_fixture{"notary_engine_pending"};
  auto publisher = notary::testing::make_signer("publisher");
  fixture.engine().finalize_block(
      1, kBlockTime,
      {fixture.encode(fixture.make_tx(publisher, 1, make_add("a")))});
  auto list = decode_query<notary::schema::assertion_list_state_t>(
      fixture, "/assertion/list_state");
  EXPECT_EQ(list.count, 0u);
  EXPECT_EQ(fixture.engine().info().last_block_height, 0);
}
