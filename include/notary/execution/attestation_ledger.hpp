#pragma once

#include <notary/execution/call_context.hpp>
#include <notary/execution/state_view.hpp>
#include <notary/schema/attestation_operations.hpp>
#include <notary/schema/attestation_record.hpp>
#include <optional>

namespace notary::execution::attestation_ledger {

std::optional<notary::schema::attestation_record_t> get(
    const state_view& state,
    const notary::schema::assertion_id_t& assertion_id,
    const notary::schema::address_t& subject);

bool is_blocked(const state_view& state,
                const notary::schema::address_t& address);

/// Signed, not revoked, subject not blocked and, for gated assertions, still
/// inside the expiry window at `now`.
bool is_attested(const state_view& state,
                 const notary::schema::assertion_id_t& assertion_id,
                 const notary::schema::address_t& subject,
                 notary::schema::timestamp_seconds_t now);

/// Signed and older than the expiry window at `now`. Gating, blocking and
/// revocation are not considered.
bool is_expired(const state_view& state,
                const notary::schema::assertion_id_t& assertion_id,
                const notary::schema::address_t& subject,
                notary::schema::timestamp_seconds_t now);

/// Multi-token balance view: 1 while `is_attested`, otherwise 0.
uint64_t balance_of(const state_view& state,
                    const notary::schema::address_t& subject,
                    const notary::schema::assertion_id_t& assertion_id,
                    notary::schema::timestamp_seconds_t now);

operation_result_t attest(call_context& context,
                          state_view& state,
                          const notary::schema::attest_t& operation);

operation_result_t revoke(call_context& context,
                          state_view& state,
                          const notary::schema::revoke_t& operation);

operation_result_t force_attest(call_context& context,
                                state_view& state,
                                const notary::schema::force_attest_t& operation);

operation_result_t force_revoke(call_context& context,
                                state_view& state,
                                const notary::schema::force_revoke_t& operation);

operation_result_t block_address(
    call_context& context,
    state_view& state,
    const notary::schema::block_address_t& operation);

operation_result_t unblock_address(
    call_context& context,
    state_view& state,
    const notary::schema::unblock_address_t& operation);

/// Attestations are bound to their subject; every transfer or approval fails.
operation_error not_transferable();

}  // namespace notary::execution::attestation_ledger
