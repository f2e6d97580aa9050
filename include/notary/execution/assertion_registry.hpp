#pragma once

#include <notary/execution/call_context.hpp>
#include <notary/execution/state_view.hpp>
#include <notary/schema/assertion_list_state.hpp>
#include <notary/schema/assertion_operations.hpp>
#include <notary/schema/assertion_record.hpp>
#include <optional>
#include <string_view>

namespace notary::execution::assertion_registry {

notary::schema::assertion_id_t assertion_id_of(std::string_view text);
notary::schema::hash32_t revoke_id_of(std::string_view text);

std::optional<notary::schema::assertion_record_t> get(
    const state_view& state,
    const notary::schema::assertion_id_t& assertion_id);

/// Assertion id at position `index` of the append-only list.
std::optional<notary::schema::assertion_id_t> at(const state_view& state,
                                                 uint64_t index);

notary::schema::assertion_list_state_t list_state(const state_view& state);
uint64_t count(const state_view& state);
notary::schema::timestamp_seconds_t last_update(const state_view& state);

/// False for unknown assertions.
bool is_stopped(const state_view& state,
                const notary::schema::assertion_id_t& assertion_id);

/// Publish an assertion. Permissionless; the attached value must cover the
/// current tip amount and is credited to the tip balance.
operation_result_t add_assertion(call_context& context,
                                 state_view& state,
                                 const notary::schema::add_assertion_t& operation);

operation_result_t set_controller(
    call_context& context,
    state_view& state,
    const notary::schema::set_controller_t& operation);

operation_result_t set_gateway(call_context& context,
                               state_view& state,
                               const notary::schema::set_gateway_t& operation);

operation_result_t stop_assertion(
    call_context& context,
    state_view& state,
    const notary::schema::stop_assertion_t& operation);

operation_result_t unstop_assertion(
    call_context& context,
    state_view& state,
    const notary::schema::unstop_assertion_t& operation);

}  // namespace notary::execution::assertion_registry
