#pragma once

#include <notary/execution/call_context.hpp>
#include <notary/execution/state_view.hpp>
#include <notary/schema/assertion_record.hpp>
#include <notary/schema/role_operations.hpp>
#include <notary/schema/role_state.hpp>

// Registry-wide roles. Every predicate treats a role held by the zero address
// as vacant.
namespace notary::execution::roles {

notary::schema::role_state_t load(const state_view& state);
void store(state_view& state, const notary::schema::role_state_t& roles);

bool is_owner(const notary::schema::role_state_t& roles,
              const notary::schema::address_t& caller);
bool is_overrider(const notary::schema::role_state_t& roles,
                  const notary::schema::address_t& caller);
bool is_tip_jar(const notary::schema::role_state_t& roles,
                const notary::schema::address_t& caller);
bool is_owner_or_overrider(const notary::schema::role_state_t& roles,
                           const notary::schema::address_t& caller);
bool is_owner_or_tip_jar(const notary::schema::role_state_t& roles,
                         const notary::schema::address_t& caller);
bool is_controller(const notary::schema::assertion_record_t& assertion,
                   const notary::schema::address_t& caller);
bool is_controller_or_owner(const notary::schema::role_state_t& roles,
                            const notary::schema::assertion_record_t& assertion,
                            const notary::schema::address_t& caller);
bool is_controller_or_overrider(
    const notary::schema::role_state_t& roles,
    const notary::schema::assertion_record_t& assertion,
    const notary::schema::address_t& caller);

operation_result_t transfer_ownership(
    call_context& context,
    state_view& state,
    const notary::schema::transfer_ownership_t& operation);

operation_result_t renounce_ownership(
    call_context& context,
    state_view& state,
    const notary::schema::renounce_ownership_t& operation);

operation_result_t set_overrider(call_context& context,
                                 state_view& state,
                                 const notary::schema::set_overrider_t& operation);

operation_result_t set_tip_jar(call_context& context,
                               state_view& state,
                               const notary::schema::set_tip_jar_t& operation);

}  // namespace notary::execution::roles
