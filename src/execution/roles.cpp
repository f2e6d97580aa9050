#include <notary/common/critical.hpp>
#include <notary/execution/events.hpp>
#include <notary/execution/roles.hpp>
#include <notary/schema/key/engine_keys.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using notary::schema::transaction_error_code;

namespace notary::execution::roles {

namespace {

bool holds(const notary::schema::address_t& role,
           const notary::schema::address_t& caller) {
  return !notary::schema::is_zero(role) && role == caller;
}

operation_error unauthorized(std::string_view operation) {
  return make_error(transaction_error_code::not_authorized,
                    fmt::format("caller may not {}", operation));
}

}  // namespace

notary::schema::role_state_t load(const state_view& state) {
  auto roles = state.get<notary::schema::role_state_t>(
      notary::schema::key::make_role_state_key(state.encoder()));
  if (!roles) {
    notary::common::critical("role state missing; genesis was not applied");
  }
  return *roles;
}

void store(state_view& state, const notary::schema::role_state_t& roles) {
  state.put(notary::schema::key::make_role_state_key(state.encoder()), roles);
}

bool is_owner(const notary::schema::role_state_t& roles,
              const notary::schema::address_t& caller) {
  return holds(roles.owner, caller);
}

bool is_overrider(const notary::schema::role_state_t& roles,
                  const notary::schema::address_t& caller) {
  return holds(roles.overrider, caller);
}

bool is_tip_jar(const notary::schema::role_state_t& roles,
                const notary::schema::address_t& caller) {
  return holds(roles.tip_jar, caller);
}

bool is_owner_or_overrider(const notary::schema::role_state_t& roles,
                           const notary::schema::address_t& caller) {
  return is_owner(roles, caller) || is_overrider(roles, caller);
}

bool is_owner_or_tip_jar(const notary::schema::role_state_t& roles,
                         const notary::schema::address_t& caller) {
  return is_owner(roles, caller) || is_tip_jar(roles, caller);
}

bool is_controller(const notary::schema::assertion_record_t& assertion,
                   const notary::schema::address_t& caller) {
  return holds(assertion.controller, caller);
}

bool is_controller_or_owner(const notary::schema::role_state_t& roles,
                            const notary::schema::assertion_record_t& assertion,
                            const notary::schema::address_t& caller) {
  return is_controller(assertion, caller) || is_owner(roles, caller);
}

bool is_controller_or_overrider(
    const notary::schema::role_state_t& roles,
    const notary::schema::assertion_record_t& assertion,
    const notary::schema::address_t& caller) {
  return is_controller(assertion, caller) || is_overrider(roles, caller);
}

operation_result_t transfer_ownership(
    call_context& context,
    state_view& state,
    const notary::schema::transfer_ownership_t& operation) {
  auto roles = load(state);
  if (!is_owner(roles, context.caller)) {
    return unauthorized("transfer ownership");
  }
  if (notary::schema::is_zero(operation.new_owner)) {
    return make_error(transaction_error_code::zero_address,
                      "new owner is the zero address");
  }
  auto previous = roles.owner;
  roles.owner = operation.new_owner;
  store(state, roles);
  events::emit(context, "OwnershipTransferred",
               {{"previous_owner", events::format(previous), true},
                {"new_owner", events::format(roles.owner), true}});
  spdlog::debug("Ownership transferred to {}",
                notary::schema::to_hex(roles.owner));
  return std::nullopt;
}

operation_result_t renounce_ownership(
    call_context& context,
    state_view& state,
    const notary::schema::renounce_ownership_t&) {
  auto roles = load(state);
  if (!is_owner(roles, context.caller)) {
    return unauthorized("renounce ownership");
  }
  auto previous = roles.owner;
  roles.owner = notary::schema::make_zero_address();
  store(state, roles);
  events::emit(context, "OwnershipTransferred",
               {{"previous_owner", events::format(previous), true},
                {"new_owner", events::format(roles.owner), true}});
  spdlog::info("Ownership renounced by {}", notary::schema::to_hex(previous));
  return std::nullopt;
}

operation_result_t set_overrider(
    call_context& context,
    state_view& state,
    const notary::schema::set_overrider_t& operation) {
  auto roles = load(state);
  if (!is_owner_or_overrider(roles, context.caller)) {
    return unauthorized("set the overrider");
  }
  if (notary::schema::is_zero(operation.overrider)) {
    return make_error(transaction_error_code::zero_address,
                      "overrider is the zero address");
  }
  auto previous = roles.overrider;
  roles.overrider = operation.overrider;
  store(state, roles);
  events::emit(context, "NewOverrider",
               {{"previous_overrider", events::format(previous), true},
                {"new_overrider", events::format(roles.overrider), true}});
  spdlog::debug("Overrider set to {}", notary::schema::to_hex(roles.overrider));
  return std::nullopt;
}

operation_result_t set_tip_jar(call_context& context,
                               state_view& state,
                               const notary::schema::set_tip_jar_t& operation) {
  auto roles = load(state);
  if (!is_owner_or_tip_jar(roles, context.caller)) {
    return unauthorized("set the tip jar");
  }
  if (notary::schema::is_zero(operation.tip_jar)) {
    return make_error(transaction_error_code::zero_address,
                      "tip jar is the zero address");
  }
  auto previous = roles.tip_jar;
  roles.tip_jar = operation.tip_jar;
  store(state, roles);
  events::emit(context, "NewTipJar",
               {{"previous_tip_jar", events::format(previous), true},
                {"new_tip_jar", events::format(roles.tip_jar), true}});
  spdlog::debug("Tip jar set to {}", notary::schema::to_hex(roles.tip_jar));
  return std::nullopt;
}

}  // namespace notary::execution::roles
