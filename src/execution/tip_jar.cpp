#include <notary/execution/events.hpp>
#include <notary/execution/roles.hpp>
#include <notary/execution/tip_jar.hpp>
#include <notary/schema/key/engine_keys.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using notary::schema::transaction_error_code;

namespace notary::execution::tip_jar {

namespace {

void store_balance(state_view& state, const notary::schema::amount_t& amount) {
  state.put(notary::schema::key::make_tip_balance_key(state.encoder()),
            notary::schema::to_word(amount));
}

}  // namespace

notary::schema::amount_t balance(const state_view& state) {
  auto word = state.get<notary::schema::hash32_t>(
      notary::schema::key::make_tip_balance_key(state.encoder()));
  if (!word) {
    return 0;
  }
  return notary::schema::from_word(*word);
}

operation_result_t check_tip(const state_view& state,
                             const notary::schema::amount_t& value) {
  auto roles = roles::load(state);
  if (value < roles.tip_amount) {
    return make_error(transaction_error_code::insufficient_tip,
                      fmt::format("tip {} below required {}", value.str(),
                                  roles.tip_amount.str()));
  }
  return std::nullopt;
}

operation_result_t accept_value(const call_context& context,
                                const state_view& state) {
  if (auto error = check_tip(state, context.value)) {
    return error;
  }
  if (context.value == 0) {
    return std::nullopt;
  }
  if (!context.rail || !context.rail->collect(context.transaction_id,
                                              context.caller, context.value)) {
    spdlog::warn("Payment rail did not confirm {} from {}",
                 context.value.str(), notary::schema::to_hex(context.caller));
    return make_error(transaction_error_code::transfer_failed,
                      "attached value was not received");
  }
  return std::nullopt;
}

void credit(call_context& context, state_view& state) {
  store_balance(state, balance(state) + context.value);
  events::emit(context, "TipReceived",
               {{"sender", events::format(context.caller), true},
                {"amount", events::format(context.value), false}});
}

operation_result_t receive(call_context& context, state_view& state) {
  if (auto error = accept_value(context, state)) {
    return error;
  }
  credit(context, state);
  return std::nullopt;
}

operation_result_t set_tip_amount(
    call_context& context,
    state_view& state,
    const notary::schema::set_tip_amount_t& operation) {
  auto roles = roles::load(state);
  if (!roles::is_owner_or_tip_jar(roles, context.caller)) {
    return make_error(transaction_error_code::not_authorized,
                      "caller is neither owner nor tip jar");
  }
  auto previous = roles.tip_amount;
  roles.tip_amount = operation.tip_amount;
  roles::store(state, roles);
  events::emit(context, "NewTipAmount",
               {{"previous_amount", events::format(previous), false},
                {"new_amount", events::format(roles.tip_amount), false}});
  spdlog::debug("Tip amount set to {}", roles.tip_amount.str());
  return std::nullopt;
}

operation_result_t tip_out(call_context& context,
                           state_view& state,
                           const notary::schema::tip_out_t&) {
  auto roles = roles::load(state);
  auto amount = balance(state);
  store_balance(state, 0);
  events::emit(context, "TipOut", {{"amount", events::format(amount), false}});
  if (amount == 0) {
    return std::nullopt;
  }
  context.payouts.push_back(payout{.to = roles.tip_jar, .amount = amount});
  spdlog::debug("Queued tip out of {} to {}", amount.str(),
                notary::schema::to_hex(roles.tip_jar));
  return std::nullopt;
}

}  // namespace notary::execution::tip_jar
