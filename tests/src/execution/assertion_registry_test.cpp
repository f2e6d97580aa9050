#include <notary/execution/assertion_registry.hpp>
#include <notary/execution/roles.hpp>
#include <notary/execution/tip_jar.hpp>
#include <notary/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

using notary::schema::transaction_error_code;
namespace registry = notary::execution::assertion_registry;

namespace {

notary::schema::add_assertion_t make_add(
    const std::string& text,
    const notary::schema::address_t& controller =
        notary::schema::make_zero_address()) {
  return notary::schema::add_assertion_t{.text = text,
                                         .freshness_window = 3600,
                                         .expiry_window = 86400,
                                         .controller = controller};
}

}  // namespace

TEST(assertion_registry, ids_are_derived_from_text) {
  EXPECT_EQ(registry::assertion_id_of("over 18"),
            registry::assertion_id_of("over 18"));
  EXPECT_NE(registry::assertion_id_of("over 18"),
            registry::assertion_id_of("over 21"));
  EXPECT_NE(registry::assertion_id_of("over 18"),
            registry::revoke_id_of("over 18"));
  EXPECT_EQ(registry::revoke_id_of("over 18"),
            registry::assertion_id_of("Revoked: over 18"));
}

TEST(assertion_registry, add_assertion_appends_and_emits) {
  auto fixture = notary::testing::module_fixture{"notary_registry_add"};
  auto publisher = notary::testing::make_address(5);
  auto context = fixture.context(publisher, 777);
  ASSERT_FALSE(registry::add_assertion(context, fixture.state(),
                                       make_add("over 18"))
                   .has_value());

  auto id = registry::assertion_id_of("over 18");
  auto stored = registry::get(fixture.state(), id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->text, "over 18");
  EXPECT_EQ(stored->revoke_id, registry::revoke_id_of("over 18"));
  EXPECT_EQ(stored->freshness_window, 3600u);
  EXPECT_FALSE(stored->stopped);

  EXPECT_EQ(registry::count(fixture.state()), 1u);
  EXPECT_EQ(registry::last_update(fixture.state()), 777u);
  EXPECT_EQ(registry::at(fixture.state(), 0), id);
  EXPECT_FALSE(registry::at(fixture.state(), 1).has_value());

  ASSERT_EQ(context.events.size(), 2u);
  EXPECT_EQ(context.events[0].type, "AssertionAdded");
  EXPECT_EQ(context.events[1].type, "TipReceived");
}

TEST(assertion_registry, rejects_empty_and_duplicate_text) {
  auto fixture = notary::testing::module_fixture{"notary_registry_dup"};
  auto context = fixture.context(notary::testing::make_address(5));
  auto error = registry::add_assertion(context, fixture.state(), make_add(""));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::empty_assertion);

  ASSERT_FALSE(registry::add_assertion(context, fixture.state(),
                                       make_add("over 18"))
                   .has_value());
  error = registry::add_assertion(context, fixture.state(), make_add("over 18"));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::duplicate_assertion);
  EXPECT_EQ(registry::count(fixture.state()), 1u);
}

TEST(assertion_registry, tip_below_amount_leaves_no_state) {
  auto fixture = notary::testing::module_fixture{"notary_registry_tip"};
  auto roles = notary::execution::roles::load(fixture.state());
  roles.tip_amount = 100;
  notary::execution::roles::store(fixture.state(), roles);

  auto poor = fixture.context(notary::testing::make_address(5), 10, 99);
  auto error =
      registry::add_assertion(poor, fixture.state(), make_add("over 18"));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::insufficient_tip);
  EXPECT_FALSE(
      registry::get(fixture.state(), registry::assertion_id_of("over 18"))
          .has_value());
  EXPECT_EQ(registry::count(fixture.state()), 0u);
  EXPECT_TRUE(poor.events.empty());

  auto generous = fixture.context(notary::testing::make_address(5), 10, 150);
  ASSERT_FALSE(registry::add_assertion(generous, fixture.state(),
                                       make_add("over 18"))
                   .has_value());
  EXPECT_EQ(notary::execution::tip_jar::balance(fixture.state()),
            notary::schema::amount_t{150});
}

TEST(assertion_registry, unconfirmed_tip_leaves_no_state) {
  auto fixture = notary::testing::module_fixture{"notary_registry_collect"};
  fixture.rail().accept_collections = false;

  auto context = fixture.context(notary::testing::make_address(5), 10, 50);
  auto error =
      registry::add_assertion(context, fixture.state(), make_add("over 18"));
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::transfer_failed);
  EXPECT_EQ(registry::count(fixture.state()), 0u);
  EXPECT_EQ(notary::execution::tip_jar::balance(fixture.state()),
            notary::schema::amount_t{0});
  EXPECT_TRUE(context.events.empty());
}

TEST(assertion_registry, controller_or_owner_sets_controller_and_gateway) {
  auto fixture = notary::testing::module_fixture{"notary_registry_controller"};
  auto controller = notary::testing::make_address(6);
  auto next = notary::testing::make_address(7);
  auto id = registry::assertion_id_of("over 18");
  auto context = fixture.context(notary::testing::make_address(5));
  ASSERT_FALSE(registry::add_assertion(context, fixture.state(),
                                       make_add("over 18", controller))
                   .has_value());

  auto overrider = fixture.context(fixture.overrider().address);
  auto error = registry::set_controller(
      overrider, fixture.state(),
      notary::schema::set_controller_t{.assertion_id = id, .controller = next});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::not_authorized);

  auto as_controller = fixture.context(controller);
  ASSERT_FALSE(registry::set_gateway(
                   as_controller, fixture.state(),
                   notary::schema::set_gateway_t{.assertion_id = id,
                                                 .gateway = next})
                   .has_value());
  EXPECT_EQ(as_controller.events.back().type, "NewGateway");

  auto owner = fixture.context(fixture.owner().address);
  ASSERT_FALSE(registry::set_controller(
                   owner, fixture.state(),
                   notary::schema::set_controller_t{.assertion_id = id,
                                                    .controller = next})
                   .has_value());
  auto stored = registry::get(fixture.state(), id);
  EXPECT_EQ(stored->controller, next);
  EXPECT_EQ(stored->gateway, next);

  error = registry::set_gateway(
      owner, fixture.state(),
      notary::schema::set_gateway_t{
          .assertion_id = registry::assertion_id_of("unknown"),
          .gateway = next});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::unknown_assertion);
}

TEST(assertion_registry, stop_and_unstop_by_controller_or_overrider) {
  auto fixture = notary::testing::module_fixture{"notary_registry_stop"};
  auto controller = notary::testing::make_address(6);
  auto id = registry::assertion_id_of("over 18");
  auto context = fixture.context(notary::testing::make_address(5));
  ASSERT_FALSE(registry::add_assertion(context, fixture.state(),
                                       make_add("over 18", controller))
                   .has_value());

  auto owner = fixture.context(fixture.owner().address);
  auto error = registry::stop_assertion(
      owner, fixture.state(), notary::schema::stop_assertion_t{.assertion_id = id});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::not_authorized);

  error = registry::unstop_assertion(
      owner, fixture.state(),
      notary::schema::unstop_assertion_t{.assertion_id = id});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::not_stopped);

  auto overrider = fixture.context(fixture.overrider().address);
  ASSERT_FALSE(registry::stop_assertion(
                   overrider, fixture.state(),
                   notary::schema::stop_assertion_t{.assertion_id = id})
                   .has_value());
  EXPECT_TRUE(registry::is_stopped(fixture.state(), id));
  EXPECT_EQ(overrider.events.back().type, "AssertionStopped");

  error = registry::stop_assertion(
      overrider, fixture.state(),
      notary::schema::stop_assertion_t{.assertion_id = id});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::already_stopped_or_unknown);

  auto as_controller = fixture.context(controller);
  ASSERT_FALSE(registry::unstop_assertion(
                   as_controller, fixture.state(),
                   notary::schema::unstop_assertion_t{.assertion_id = id})
                   .has_value());
  EXPECT_FALSE(registry::is_stopped(fixture.state(), id));
  EXPECT_EQ(as_controller.events.back().type, "AssertionUnStopped");
}

TEST(assertion_registry, unknown_assertion_is_not_stopped) {
  auto fixture = notary::testing::module_fixture{"notary_registry_unknown"};
  auto id = registry::assertion_id_of("missing");
  EXPECT_FALSE(registry::is_stopped(fixture.state(), id));
  auto overrider = fixture.context(fixture.overrider().address);
  auto error = registry::stop_assertion(
      overrider, fixture.state(),
      notary::schema::stop_assertion_t{.assertion_id = id});
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, transaction_error_code::already_stopped_or_unknown);
}
