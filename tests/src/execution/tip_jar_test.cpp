#include <notary/execution/roles.hpp>
#include <notary/execution/tip_jar.hpp>
#include <notary/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

using notary::schema::transaction_error_code;
namespace tip_jar = notary::execution::tip_jar;

TEST(tip_jar, deposit_credits_balance) {
  auto fixture = notary::testing::module_fixture{"notary_tip_deposit"};
  EXPECT_EQ(tip_jar::balance(fixture.state()), notary::schema::amount_t{0});

  auto context = fixture.context(notary::testing::make_address(5), 1, 40);
  ASSERT_FALSE(tip_jar::receive(context, fixture.state()).has_value());
  context = fixture.context(notary::testing::make_address(5), 2, 2);
  ASSERT_FALSE(tip_jar::receive(context, fixture.state()).has_value());
  EXPECT_EQ(tip_jar::balance(fixture.state()), notary::schema::amount_t{42});
  ASSERT_EQ(fixture.rail().collections.size(), 2u);
  EXPECT_EQ(fixture.rail().collections[1].second, notary::schema::amount_t{2});
  ASSERT_EQ(context.events.size(), 1u);
  EXPECT_EQ(context.events[0].type, "TipReceived");
  EXPECT_EQ(context.events[0].attributes[1].value, "2");
}

TEST(tip_jar, set_tip_amount_by_owner_or_tip_jar) {
  auto fixture = notary::testing::module_fixture{"notary_tip_amount"};
  auto stranger = fixture.context(notary::testing::make_address(5));
  auto error = tip_jar::set_tip_amount(
      stranger, fixture.state(), notary::schema::set_tip_amount_t{.tip_amount = 7});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::not_authorized);

  auto jar = fixture.context(fixture.tip_jar().address);
  ASSERT_FALSE(tip_jar::set_tip_amount(
                   jar, fixture.state(),
                   notary::schema::set_tip_amount_t{.tip_amount = 7})
                   .has_value());
  EXPECT_EQ(notary::execution::roles::load(fixture.state()).tip_amount,
            notary::schema::amount_t{7});
  EXPECT_EQ(jar.events.back().type, "NewTipAmount");

  EXPECT_TRUE(tip_jar::check_tip(fixture.state(), 6).has_value());
  EXPECT_FALSE(tip_jar::check_tip(fixture.state(), 7).has_value());
}

TEST(tip_jar, tip_out_queues_payout_to_the_tip_jar) {
  auto fixture = notary::testing::module_fixture{"notary_tip_out"};
  auto deposit = fixture.context(notary::testing::make_address(5), 1, 500);
  ASSERT_FALSE(tip_jar::receive(deposit, fixture.state()).has_value());

  auto anyone = fixture.context(notary::testing::make_address(6));
  ASSERT_FALSE(tip_jar::tip_out(anyone, fixture.state(),
                                notary::schema::tip_out_t{})
                   .has_value());
  ASSERT_EQ(anyone.payouts.size(), 1u);
  EXPECT_EQ(anyone.payouts[0].to, fixture.tip_jar().address);
  EXPECT_EQ(anyone.payouts[0].amount, notary::schema::amount_t{500});
  EXPECT_TRUE(fixture.rail().transfers.empty());
  EXPECT_EQ(tip_jar::balance(fixture.state()), notary::schema::amount_t{0});
  ASSERT_EQ(anyone.events.size(), 1u);
  EXPECT_EQ(anyone.events[0].type, "TipOut");
  EXPECT_EQ(anyone.events[0].attributes[0].value, "500");
}

TEST(tip_jar, empty_balance_queues_nothing) {
  auto fixture = notary::testing::module_fixture{"notary_tip_empty"};
  auto context = fixture.context(notary::testing::make_address(6));
  ASSERT_FALSE(tip_jar::tip_out(context, fixture.state(),
                                notary::schema::tip_out_t{})
                   .has_value());
  EXPECT_TRUE(context.payouts.empty());
  ASSERT_EQ(context.events.size(), 1u);
  EXPECT_EQ(context.events[0].attributes[0].value, "0");
}

TEST(tip_jar, refused_collection_credits_nothing) {
  auto fixture = notary::testing::module_fixture{"notary_tip_refused"};
  fixture.rail().accept_collections = false;

  auto context = fixture.context(notary::testing::make_address(5), 1,
                                 notary::schema::amount_t{"1000000000000000000000000000000"});
  auto error = tip_jar::receive(context, fixture.state());
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::transfer_failed);
  EXPECT_EQ(tip_jar::balance(fixture.state()), notary::schema::amount_t{0});
  EXPECT_TRUE(context.events.empty());
}

TEST(tip_jar, zero_value_skips_the_rail) {
  auto fixture = notary::testing::module_fixture{"notary_tip_zero"};
  fixture.rail().accept_collections = false;
  auto context = fixture.context(notary::testing::make_address(5));
  ASSERT_FALSE(tip_jar::receive(context, fixture.state()).has_value());
  EXPECT_TRUE(fixture.rail().collections.empty());
  EXPECT_EQ(tip_jar::balance(fixture.state()), notary::schema::amount_t{0});
}

TEST(tip_jar, value_without_a_rail_is_refused) {
  auto fixture = notary::testing::module_fixture{"notary_tip_norail"};
  auto context = fixture.context(notary::testing::make_address(5), 1, 10);
  context.rail = nullptr;
  auto error = tip_jar::receive(context, fixture.state());
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::transfer_failed);
}
