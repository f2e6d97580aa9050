#pragma once

#include <notary/execution/call_context.hpp>
#include <notary/execution/state_view.hpp>
#include <notary/schema/tip_operations.hpp>

namespace notary::execution::tip_jar {

notary::schema::amount_t balance(const state_view& state);

/// `insufficient_tip` when `value` is below the current tip amount.
operation_result_t check_tip(const state_view& state,
                             const notary::schema::amount_t& value);

/// Check the attached value against the tip amount and have the rail confirm
/// it was received. `transfer_failed` when the rail refuses.
operation_result_t accept_value(const call_context& context,
                                const state_view& state);

/// Credit the attached value to the balance and emit TipReceived.
void credit(call_context& context, state_view& state);

/// `accept_value` followed by `credit`.
operation_result_t receive(call_context& context, state_view& state);

operation_result_t set_tip_amount(
    call_context& context,
    state_view& state,
    const notary::schema::set_tip_amount_t& operation);

/// Clear the balance and queue it as a payout to the tip jar. The payout is
/// released only after the block commits.
operation_result_t tip_out(call_context& context,
                           state_view& state,
                           const notary::schema::tip_out_t& operation);

}  // namespace notary::execution::tip_jar
