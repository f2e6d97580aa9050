#include <notary/crypto/verify.hpp>
#include <notary/execution/assertion_registry.hpp>
#include <notary/execution/attestation_ledger.hpp>
#include <notary/execution/events.hpp>
#include <notary/execution/roles.hpp>
#include <notary/schema/key/engine_keys.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using notary::schema::transaction_error_code;

namespace notary::execution::attestation_ledger {

namespace {

void store(state_view& state,
           const notary::schema::assertion_id_t& assertion_id,
           const notary::schema::address_t& subject,
           const notary::schema::attestation_record_t& record) {
  state.put(notary::schema::key::make_attestation_key(state.encoder(),
                                                      assertion_id, subject),
            record);
}

operation_error unknown(const notary::schema::assertion_id_t& assertion_id) {
  return make_error(transaction_error_code::unknown_assertion,
                    fmt::format("assertion {} does not exist",
                                notary::schema::to_hex(assertion_id)));
}

operation_error not_overrider() {
  return make_error(transaction_error_code::not_authorized,
                    "caller is not the overrider");
}

// Seconds elapsed since `then`; a timestamp ahead of `now` counts as fresh.
notary::schema::duration_seconds_t age(notary::schema::timestamp_seconds_t now,
                                       notary::schema::timestamp_seconds_t then) {
  return now > then ? now - then : 0;
}

void record_attestation(call_context& context,
                        state_view& state,
                        const notary::schema::assertion_id_t& assertion_id,
                        const notary::schema::address_t& subject,
                        notary::schema::timestamp_seconds_t signed_at) {
  store(state, assertion_id, subject,
        notary::schema::attestation_record_t{.signed_at = signed_at,
                                             .revoked = false});
  events::emit(context, "Attested",
               {{"assertion_id", events::format(assertion_id), true},
                {"subject", events::format(subject), true},
                {"signed_at", events::format(signed_at), false}});
  spdlog::debug("{} attested {}", notary::schema::to_hex(subject),
                notary::schema::to_hex(assertion_id));
}

void record_revocation(call_context& context,
                       state_view& state,
                       const notary::schema::assertion_id_t& assertion_id,
                       const notary::schema::address_t& subject) {
  auto record = get(state, assertion_id, subject)
                    .value_or(notary::schema::attestation_record_t{});
  record.revoked = true;
  store(state, assertion_id, subject, record);
  events::emit(context, "Revoked",
               {{"assertion_id", events::format(assertion_id), true},
                {"subject", events::format(subject), true}});
  spdlog::debug("{} revoked {}", notary::schema::to_hex(subject),
                notary::schema::to_hex(assertion_id));
}

}  // namespace

std::optional<notary::schema::attestation_record_t> get(
    const state_view& state,
    const notary::schema::assertion_id_t& assertion_id,
    const notary::schema::address_t& subject) {
  return state.get<notary::schema::attestation_record_t>(
      notary::schema::key::make_attestation_key(state.encoder(), assertion_id,
                                                subject));
}

bool is_blocked(const state_view& state,
                const notary::schema::address_t& address) {
  return state.contains(
      notary::schema::key::make_blocklist_key(state.encoder(), address));
}

bool is_attested(const state_view& state,
                 const notary::schema::assertion_id_t& assertion_id,
                 const notary::schema::address_t& subject,
                 notary::schema::timestamp_seconds_t now) {
  auto record = get(state, assertion_id, subject);
  if (!record || record->signed_at == 0 || record->revoked) {
    return false;
  }
  if (is_blocked(state, subject)) {
    return false;
  }
  auto assertion = assertion_registry::get(state, assertion_id);
  if (!assertion) {
    return false;
  }
  if (assertion->requires_gateway &&
      age(now, record->signed_at) > assertion->expiry_window) {
    return false;
  }
  return true;
}

bool is_expired(const state_view& state,
                const notary::schema::assertion_id_t& assertion_id,
                const notary::schema::address_t& subject,
                notary::schema::timestamp_seconds_t now) {
  auto record = get(state, assertion_id, subject);
  if (!record || record->signed_at == 0) {
    return false;
  }
  auto assertion = assertion_registry::get(state, assertion_id);
  if (!assertion) {
    return false;
  }
  return age(now, record->signed_at) > assertion->expiry_window;
}

uint64_t balance_of(const state_view& state,
                    const notary::schema::address_t& subject,
                    const notary::schema::assertion_id_t& assertion_id,
                    notary::schema::timestamp_seconds_t now) {
  return is_attested(state, assertion_id, subject, now) ? 1 : 0;
}

operation_result_t attest(call_context& context,
                          state_view& state,
                          const notary::schema::attest_t& operation) {
  auto assertion = assertion_registry::get(state, operation.assertion_id);
  if (!assertion) {
    return unknown(operation.assertion_id);
  }
  if (assertion->stopped) {
    return make_error(transaction_error_code::assertion_stopped,
                      "assertion is stopped");
  }
  if (is_blocked(state, operation.subject)) {
    return make_error(transaction_error_code::address_blocked,
                      fmt::format("address {} is blocked",
                                  notary::schema::to_hex(operation.subject)));
  }
  if (assertion->requires_gateway && assertion->gateway != context.caller) {
    return make_error(transaction_error_code::gateway_required,
                      "assertion only accepts attestations from its gateway");
  }
  auto earliest = context.now > assertion->freshness_window
                      ? context.now - assertion->freshness_window
                      : notary::schema::timestamp_seconds_t{0};
  if (operation.signed_at < earliest || operation.signed_at > context.now) {
    return make_error(
        transaction_error_code::signature_expired,
        fmt::format("signature time {} outside [{}, {}]", operation.signed_at,
                    earliest, context.now));
  }
  if (!notary::crypto::verify_attestation_signature(
          context.domain, assertion->text, operation.signed_at,
          operation.subject, operation.signature)) {
    return make_error(transaction_error_code::invalid_signature,
                      "attestation signature does not match subject");
  }
  record_attestation(context, state, operation.assertion_id, operation.subject,
                     operation.signed_at);
  return std::nullopt;
}

operation_result_t revoke(call_context& context,
                          state_view& state,
                          const notary::schema::revoke_t& operation) {
  auto assertion = assertion_registry::get(state, operation.assertion_id);
  if (!assertion) {
    return unknown(operation.assertion_id);
  }
  if (!notary::crypto::verify_attestation_signature(
          context.domain, notary::crypto::revocation_text(assertion->text),
          operation.signed_at, operation.subject, operation.signature)) {
    return make_error(transaction_error_code::invalid_signature,
                      "revocation signature does not match subject");
  }
  record_revocation(context, state, operation.assertion_id, operation.subject);
  return std::nullopt;
}

operation_result_t force_attest(
    call_context& context,
    state_view& state,
    const notary::schema::force_attest_t& operation) {
  if (!roles::is_overrider(roles::load(state), context.caller)) {
    return not_overrider();
  }
  if (!assertion_registry::get(state, operation.assertion_id)) {
    return unknown(operation.assertion_id);
  }
  record_attestation(context, state, operation.assertion_id, operation.subject,
                     operation.signed_at);
  return std::nullopt;
}

operation_result_t force_revoke(
    call_context& context,
    state_view& state,
    const notary::schema::force_revoke_t& operation) {
  if (!roles::is_overrider(roles::load(state), context.caller)) {
    return not_overrider();
  }
  if (!assertion_registry::get(state, operation.assertion_id)) {
    return unknown(operation.assertion_id);
  }
  record_revocation(context, state, operation.assertion_id, operation.subject);
  return std::nullopt;
}

operation_result_t block_address(
    call_context& context,
    state_view& state,
    const notary::schema::block_address_t& operation) {
  if (!roles::is_overrider(roles::load(state), context.caller)) {
    return not_overrider();
  }
  if (is_blocked(state, operation.address)) {
    return make_error(transaction_error_code::already_blocked,
                      "address is already blocked");
  }
  state.put(
      notary::schema::key::make_blocklist_key(state.encoder(), operation.address),
      true);
  events::emit(context, "Blocked",
               {{"address", events::format(operation.address), true}});
  spdlog::info("Blocked {}", notary::schema::to_hex(operation.address));
  return std::nullopt;
}

operation_result_t unblock_address(
    call_context& context,
    state_view& state,
    const notary::schema::unblock_address_t& operation) {
  if (!roles::is_overrider(roles::load(state), context.caller)) {
    return not_overrider();
  }
  if (!is_blocked(state, operation.address)) {
    return make_error(transaction_error_code::not_blocked,
                      "address is not blocked");
  }
  state.erase(
      notary::schema::key::make_blocklist_key(state.encoder(), operation.address));
  events::emit(context, "UnBlocked",
               {{"address", events::format(operation.address), true}});
  spdlog::info("Unblocked {}", notary::schema::to_hex(operation.address));
  return std::nullopt;
}

operation_error not_transferable() {
  return make_error(transaction_error_code::not_transferable,
                    "attestations are not transferable");
}

}  // namespace notary::execution::attestation_ledger
