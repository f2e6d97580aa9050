#include <notary/blake3/hash.hpp>
#include <notary/crypto/typed_data.hpp>
#include <notary/execution/assertion_registry.hpp>
#include <notary/execution/events.hpp>
#include <notary/execution/roles.hpp>
#include <notary/execution/tip_jar.hpp>
#include <notary/schema/key/engine_keys.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

using notary::schema::transaction_error_code;

namespace notary::execution::assertion_registry {

namespace {

void store(state_view& state,
           const notary::schema::assertion_record_t& assertion) {
  state.put(notary::schema::key::make_assertion_key(state.encoder(),
                                                    assertion.assertion_id),
            assertion);
}

operation_error unknown(const notary::schema::assertion_id_t& assertion_id) {
  return make_error(transaction_error_code::unknown_assertion,
                    fmt::format("assertion {} does not exist",
                                notary::schema::to_hex(assertion_id)));
}

}  // namespace

notary::schema::assertion_id_t assertion_id_of(std::string_view text) {
  return notary::blake3::hash(text);
}

notary::schema::hash32_t revoke_id_of(std::string_view text) {
  return notary::blake3::hash(notary::crypto::revocation_text(text));
}

std::optional<notary::schema::assertion_record_t> get(
    const state_view& state,
    const notary::schema::assertion_id_t& assertion_id) {
  return state.get<notary::schema::assertion_record_t>(
      notary::schema::key::make_assertion_key(state.encoder(), assertion_id));
}

std::optional<notary::schema::assertion_id_t> at(const state_view& state,
                                                 uint64_t index) {
  return state.get<notary::schema::assertion_id_t>(
      notary::schema::key::make_assertion_list_key(state.encoder(), index));
}

notary::schema::assertion_list_state_t list_state(const state_view& state) {
  return state
      .get<notary::schema::assertion_list_state_t>(
          notary::schema::key::make_assertion_list_state_key(state.encoder()))
      .value_or(notary::schema::assertion_list_state_t{});
}

uint64_t count(const state_view& state) {
  return list_state(state).count;
}

notary::schema::timestamp_seconds_t last_update(const state_view& state) {
  return list_state(state).last_update;
}

bool is_stopped(const state_view& state,
                const notary::schema::assertion_id_t& assertion_id) {
  auto assertion = get(state, assertion_id);
  return assertion.has_value() && assertion->stopped;
}

operation_result_t add_assertion(
    call_context& context,
    state_view& state,
    const notary::schema::add_assertion_t& operation) {
  if (operation.text.empty()) {
    return make_error(transaction_error_code::empty_assertion,
                      "assertion text is empty");
  }
  auto assertion_id = assertion_id_of(operation.text);
  if (get(state, assertion_id)) {
    return make_error(transaction_error_code::duplicate_assertion,
                      fmt::format("assertion {} already exists",
                                  notary::schema::to_hex(assertion_id)));
  }
  if (auto error = tip_jar::accept_value(context, state)) {
    return error;
  }

  auto assertion = notary::schema::assertion_record_t{
      .text = operation.text,
      .assertion_id = assertion_id,
      .revoke_id = revoke_id_of(operation.text),
      .freshness_window = operation.freshness_window,
      .expiry_window = operation.expiry_window,
      .requires_gateway = operation.requires_gateway,
      .gateway = operation.gateway,
      .controller = operation.controller};
  store(state, assertion);

  auto list = list_state(state);
  state.put(notary::schema::key::make_assertion_list_key(state.encoder(),
                                                         list.count),
            assertion_id);
  list.count += 1;
  list.last_update = context.now;
  state.put(notary::schema::key::make_assertion_list_state_key(state.encoder()),
            list);

  events::emit(
      context, "AssertionAdded",
      {{"text", assertion.text, false},
       {"freshness_window", events::format(assertion.freshness_window), false},
       {"expiry_window", events::format(assertion.expiry_window), false},
       {"requires_gateway", events::format(assertion.requires_gateway), false},
       {"gateway", events::format(assertion.gateway), false},
       {"controller", events::format(assertion.controller), false},
       {"assertion_id", events::format(assertion.assertion_id), true},
       {"revoke_id", events::format(assertion.revoke_id), true}});
  spdlog::debug("Assertion {} added at index {}",
                notary::schema::to_hex(assertion_id), list.count - 1);

  tip_jar::credit(context, state);
  return std::nullopt;
}

operation_result_t set_controller(
    call_context& context,
    state_view& state,
    const notary::schema::set_controller_t& operation) {
  auto assertion = get(state, operation.assertion_id);
  if (!assertion) {
    return unknown(operation.assertion_id);
  }
  if (!roles::is_controller_or_owner(roles::load(state), *assertion,
                                     context.caller)) {
    return make_error(transaction_error_code::not_authorized,
                      "caller is neither controller nor owner");
  }
  auto previous = assertion->controller;
  assertion->controller = operation.controller;
  store(state, *assertion);
  events::emit(context, "NewController",
               {{"assertion_id", events::format(operation.assertion_id), true},
                {"previous_controller", events::format(previous), false},
                {"new_controller", events::format(operation.controller),
                 false}});
  return std::nullopt;
}

operation_result_t set_gateway(call_context& context,
                               state_view& state,
                               const notary::schema::set_gateway_t& operation) {
  auto assertion = get(state, operation.assertion_id);
  if (!assertion) {
    return unknown(operation.assertion_id);
  }
  if (!roles::is_controller_or_owner(roles::load(state), *assertion,
                                     context.caller)) {
    return make_error(transaction_error_code::not_authorized,
                      "caller is neither controller nor owner");
  }
  auto previous = assertion->gateway;
  assertion->gateway = operation.gateway;
  store(state, *assertion);
  events::emit(context, "NewGateway",
               {{"assertion_id", events::format(operation.assertion_id), true},
                {"previous_gateway", events::format(previous), false},
                {"new_gateway", events::format(operation.gateway), false}});
  return std::nullopt;
}

operation_result_t stop_assertion(
    call_context& context,
    state_view& state,
    const notary::schema::stop_assertion_t& operation) {
  auto assertion = get(state, operation.assertion_id);
  if (!assertion || assertion->stopped) {
    return make_error(transaction_error_code::already_stopped_or_unknown,
                      "assertion is unknown or already stopped");
  }
  if (!roles::is_controller_or_overrider(roles::load(state), *assertion,
                                         context.caller)) {
    return make_error(transaction_error_code::not_authorized,
                      "caller is neither controller nor overrider");
  }
  assertion->stopped = true;
  store(state, *assertion);
  events::emit(context, "AssertionStopped",
               {{"assertion_id", events::format(operation.assertion_id),
                 true}});
  spdlog::info("Assertion {} stopped",
               notary::schema::to_hex(operation.assertion_id));
  return std::nullopt;
}

operation_result_t unstop_assertion(
    call_context& context,
    state_view& state,
    const notary::schema::unstop_assertion_t& operation) {
  auto assertion = get(state, operation.assertion_id);
  if (!assertion || !assertion->stopped) {
    return make_error(transaction_error_code::not_stopped,
                      "assertion is unknown or not stopped");
  }
  if (!roles::is_controller_or_overrider(roles::load(state), *assertion,
                                         context.caller)) {
    return make_error(transaction_error_code::not_authorized,
                      "caller is neither controller nor overrider");
  }
  assertion->stopped = false;
  store(state, *assertion);
  events::emit(context, "AssertionUnStopped",
               {{"assertion_id", events::format(operation.assertion_id),
                 true}});
  spdlog::info("Assertion {} resumed",
               notary::schema::to_hex(operation.assertion_id));
  return std::nullopt;
}

}  // namespace notary::execution::assertion_registry
