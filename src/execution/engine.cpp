#include <spdlog/spdlog.h>
#include <notary/blake3/hash.hpp>
#include <notary/execution/assertion_registry.hpp>
#include <notary/execution/attestation_ledger.hpp>
#include <notary/execution/engine.hpp>
#include <notary/execution/roles.hpp>
#include <notary/execution/tip_jar.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/key/engine_keys.hpp>
#include <notary/schema/query_error_code.hpp>
#include <notary/schema/transaction_error_code.hpp>

#include <fmt/format.h>
#include <algorithm>
#include <iterator>
#include <tuple>
#include <utility>

using namespace notary::schema;

namespace {

inline constexpr std::string_view kCheckCodespace{"notary.checktx"};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         uint64_t height,
                         uint64_t index) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = notary::execution::encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return notary::blake3::hash(bytes_view_t{material.data(), material.size()});
}

transaction_result_t make_error_result(
    const notary::execution::operation_error& error) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(error.code);
  result.log = std::string{to_string(error.code)};
  result.info = error.message;
  result.codespace =
      fmt::format("notary.{}", to_string(category_of(error.code)));
  return result;
}

transaction_result_t make_decode_error_result(std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(transaction_error_code::invalid_transaction);
  result.log = std::string{to_string(transaction_error_code::invalid_transaction)};
  result.info = "transaction bytes do not decode";
  result.codespace = std::string{codespace};
  return result;
}

query_result_t make_query_error(query_error_code code,
                                std::string log,
                                const bytes_view_t& key,
                                int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.key = make_bytes(key);
  result.height = height;
  result.codespace = "notary.query";
  return result;
}

bool accepts_value(const transaction_payload_t& payload) {
  return std::holds_alternative<add_assertion_t>(payload) ||
         std::holds_alternative<deposit_t>(payload);
}

uint64_t expected_nonce(const notary::execution::state_view& state,
                        const address_t& sender) {
  return state
      .get<uint64_t>(key::make_nonce_key(state.encoder(), sender))
      .value_or(1);
}

}  // namespace

namespace notary::execution {

engine::engine(encoder_t& encoder,
               storage_t& storage,
               const genesis_config& genesis,
               payment_rail& rail,
               bool require_strict_crypto)
    : encoder_{encoder},
      storage_{storage},
      rail_{rail},
      domain_{notary::crypto::domain_t{
          .chain_id = genesis.chain_id,
          .verifying_address = genesis.registry_address}},
      require_strict_crypto_{require_strict_crypto},
      signature_verifier_{make_secp256k1_verifier()} {
  auto lock = std::scoped_lock{mutex_};
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_time_ = committed->block_time;
    last_committed_state_root_ = committed->state_root;
  }
  apply_genesis(genesis);
  if (!require_strict_crypto_) {
    spdlog::warn("Strict crypto disabled; envelope signatures are not checked");
  }
  spdlog::info("Execution engine ready at height {} for chain {}",
               last_committed_height_, to_hex(domain_.chain_id));
}

void engine::apply_genesis(const genesis_config& genesis) {
  auto state = state_view{storage_};
  if (state.contains(key::make_role_state_key(encoder_))) {
    return;
  }
  if (is_zero(genesis.owner)) {
    spdlog::warn("Genesis owner is the zero address; owner-gated operations "
                 "are disabled");
  }
  auto initial = role_state_t{
      .owner = genesis.owner,
      .overrider = genesis.overrider.value_or(make_zero_address()),
      .tip_jar = genesis.tip_jar.value_or(genesis.owner),
      .tip_amount = genesis.tip_amount};
  roles::store(state, initial);
  storage_.commit(state.entries(),
                  notary::storage::committed_state{
                      .height = last_committed_height_,
                      .block_time = last_committed_time_,
                      .state_root = last_committed_state_root_});
  spdlog::info("Applied genesis: owner {}, overrider {}, tip jar {}",
               to_hex(initial.owner), to_hex(initial.overrider),
               to_hex(initial.tip_jar));
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  signature_verifier_ = std::move(verifier);
}

std::optional<operation_error> engine::validate_transaction(
    const state_view& state,
    const transaction_t& tx,
    bool exact_nonce) const {
  if (tx.version != 1) {
    return make_error(transaction_error_code::unsupported_transaction_version,
                      "expected version 1");
  }
  if (tx.chain_id != domain_.chain_id) {
    return make_error(transaction_error_code::invalid_chain_id,
                      fmt::format("expected chain {}", to_hex(domain_.chain_id)));
  }
  if (is_zero(tx.sender)) {
    return make_error(transaction_error_code::invalid_sender,
                      "sender is the zero address");
  }
  auto expected = expected_nonce(state, tx.sender);
  if (exact_nonce ? tx.nonce != expected : tx.nonce < expected) {
    return make_error(
        transaction_error_code::invalid_nonce,
        fmt::format("nonce {} does not match expected {}", tx.nonce, expected));
  }
  if (require_strict_crypto_ &&
      !signature_verifier_(signing_digest(tx), tx.sender, tx.signature)) {
    return make_error(transaction_error_code::signature_verification_failed,
                      "envelope signature does not match sender");
  }
  return std::nullopt;
}

transaction_result_t engine::check_transaction(const bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto maybe_tx = encoder_.try_decode<transaction_t>(raw_tx);
  if (!maybe_tx) {
    return make_decode_error_result(kCheckCodespace);
  }
  auto state = state_view{storage_};
  if (auto error = validate_transaction(state, *maybe_tx, false)) {
    return make_error_result(*error);
  }
  if (maybe_tx->value > 0 && !accepts_value(maybe_tx->payload)) {
    return make_error_result(make_error(transaction_error_code::non_payable,
                                        "operation does not accept value"));
  }
  return transaction_result_t{};
}

operation_result_t engine::execute_operation(call_context& context,
                                             state_view& state,
                                             const transaction_t& tx) {
  if (context.value > 0 && !accepts_value(tx.payload)) {
    return make_error(transaction_error_code::non_payable,
                      "operation does not accept value");
  }
  return std::visit(
      overloaded{
          [&](const add_assertion_t& op) {
            return assertion_registry::add_assertion(context, state, op);
          },
          [&](const set_controller_t& op) {
            return assertion_registry::set_controller(context, state, op);
          },
          [&](const set_gateway_t& op) {
            return assertion_registry::set_gateway(context, state, op);
          },
          [&](const stop_assertion_t& op) {
            return assertion_registry::stop_assertion(context, state, op);
          },
          [&](const unstop_assertion_t& op) {
            return assertion_registry::unstop_assertion(context, state, op);
          },
          [&](const attest_t& op) {
            return attestation_ledger::attest(context, state, op);
          },
          [&](const revoke_t& op) {
            return attestation_ledger::revoke(context, state, op);
          },
          [&](const force_attest_t& op) {
            return attestation_ledger::force_attest(context, state, op);
          },
          [&](const force_revoke_t& op) {
            return attestation_ledger::force_revoke(context, state, op);
          },
          [&](const block_address_t& op) {
            return attestation_ledger::block_address(context, state, op);
          },
          [&](const unblock_address_t& op) {
            return attestation_ledger::unblock_address(context, state, op);
          },
          [&](const set_tip_amount_t& op) {
            return tip_jar::set_tip_amount(context, state, op);
          },
          [&](const tip_out_t& op) {
            return tip_jar::tip_out(context, state, op);
          },
          [&](const set_overrider_t& op) {
            return roles::set_overrider(context, state, op);
          },
          [&](const set_tip_jar_t& op) {
            return roles::set_tip_jar(context, state, op);
          },
          [&](const transfer_ownership_t& op) {
            return roles::transfer_ownership(context, state, op);
          },
          [&](const renounce_ownership_t& op) {
            return roles::renounce_ownership(context, state, op);
          },
          [&](const deposit_t&) { return tip_jar::receive(context, state); },
          [&](const safe_transfer_from_t&) -> operation_result_t {
            return attestation_ledger::not_transferable();
          },
          [&](const safe_batch_transfer_from_t&) -> operation_result_t {
            return attestation_ledger::not_transferable();
          },
          [&](const set_approval_for_all_t&) -> operation_result_t {
            return attestation_ledger::not_transferable();
          }},
      tx.payload);
}

block_result_t engine::finalize_block(uint64_t height,
                                      timestamp_seconds_t block_time,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  if (pending_state_) {
    spdlog::warn("Discarding uncommitted block {} and {} payout(s)",
                 pending_height_, pending_payouts_.size());
  }
  pending_state_ = std::make_unique<state_view>(storage_);
  pending_payouts_.clear();
  auto& block_state = *pending_state_;

  auto rolling_hash = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto maybe_tx = encoder_.try_decode<transaction_t>(make_bytes_view(txs[i]));
    if (!maybe_tx) {
      result.tx_results.push_back(make_decode_error_result("notary.finalize"));
      continue;
    }
    const auto& tx = *maybe_tx;
    if (auto error = validate_transaction(block_state, tx, true)) {
      spdlog::debug("Rejected tx {} in block {}: {}", i, height, error->message);
      result.tx_results.push_back(make_error_result(*error));
      continue;
    }
    block_state.put(key::make_nonce_key(encoder_, tx.sender), tx.nonce + 1);

    auto tx_state = state_view{block_state};
    auto context = call_context{
        .caller = tx.sender,
        .value = tx.value,
        .now = block_time,
        .domain = domain_,
        .transaction_id = notary::blake3::hash(make_bytes_view(txs[i])),
        .rail = &rail_};
    if (auto error = execute_operation(context, tx_state, tx)) {
      spdlog::debug("Tx {} in block {} failed: {}", i, height, error->message);
      result.tx_results.push_back(make_error_result(*error));
      continue;
    }
    tx_state.merge();
    std::move(std::begin(context.payouts), std::end(context.payouts),
              std::back_inserter(pending_payouts_));
    auto tx_result = transaction_result_t{};
    tx_result.events = std::move(context.events);
    result.tx_results.push_back(std::move(tx_result));
    rolling_hash = fold_state_root(rolling_hash, txs[i], height, i);
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_time_ = block_time;
  pending_state_root_ = rolling_hash;
  result.state_root = rolling_hash;
  spdlog::info("Finalized block {} with {} transaction(s)", height, txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_state_) {
    storage_.commit(pending_state_->entries(),
                    notary::storage::committed_state{
                        .height = pending_height_,
                        .block_time = pending_time_,
                        .state_root = pending_state_root_});
    last_committed_height_ = pending_height_;
    last_committed_time_ = pending_time_;
    last_committed_state_root_ = pending_state_root_;
    pending_state_.reset();
    spdlog::info("Committed block {}", last_committed_height_);
    std::move(std::begin(pending_payouts_), std::end(pending_payouts_),
              std::back_inserter(undelivered_payouts_));
    pending_payouts_.clear();
  }
  release_payouts();

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

void engine::release_payouts() {
  auto refused = std::vector<payout>{};
  for (auto& entry : undelivered_payouts_) {
    if (rail_.transfer(entry.to, entry.amount)) {
      spdlog::info("Paid out {} to {}", entry.amount.str(), to_hex(entry.to));
      continue;
    }
    spdlog::error("Payment rail refused payout of {} to {}; retrying on next "
                  "commit",
                  entry.amount.str(), to_hex(entry.to));
    refused.push_back(std::move(entry));
  }
  undelivered_payouts_ = std::move(refused);
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  return make_info();
}

app_info_t engine::make_info() const {
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_time = last_committed_time_;
  result.last_block_state_root = last_committed_state_root_;
  result.chain_id = domain_.chain_id;
  result.registry_address = domain_.verifying_address;
  return result;
}

query_result_t engine::query(std::string_view path, const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_view{storage_};
  auto now = last_committed_time_;
  auto height = last_committed_height_;

  auto answer = [&](const auto& value) {
    auto result = query_result_t{};
    result.key = make_bytes(data);
    result.value = encoder_.encode(value);
    result.height = height;
    return result;
  };
  auto invalid_key = [&]() {
    return make_query_error(query_error_code::invalid_key,
                            fmt::format("malformed data for {}", path), data,
                            height);
  };
  auto not_found = [&]() {
    return make_query_error(query_error_code::not_found, "not found", data,
                            height);
  };

  if (path == "/engine/info") {
    return answer(make_info());
  }
  if (path == "/roles") {
    return answer(roles::load(state));
  }
  if (path == "/tips/balance") {
    return answer(to_word(tip_jar::balance(state)));
  }
  if (path == "/nonce") {
    auto sender = encoder_.try_decode<address_t>(data);
    if (!sender) {
      return invalid_key();
    }
    return answer(expected_nonce(state, *sender));
  }
  if (path == "/assertion/get") {
    auto assertion_id = encoder_.try_decode<assertion_id_t>(data);
    if (!assertion_id) {
      return invalid_key();
    }
    auto assertion = assertion_registry::get(state, *assertion_id);
    if (!assertion) {
      return not_found();
    }
    return answer(*assertion);
  }
  if (path == "/assertion/at") {
    auto index = encoder_.try_decode<uint64_t>(data);
    if (!index) {
      return invalid_key();
    }
    auto assertion_id = assertion_registry::at(state, *index);
    if (!assertion_id) {
      return not_found();
    }
    return answer(*assertion_id);
  }
  if (path == "/assertion/list_state") {
    return answer(assertion_registry::list_state(state));
  }
  if (path == "/assertion/is_stopped") {
    auto assertion_id = encoder_.try_decode<assertion_id_t>(data);
    if (!assertion_id) {
      return invalid_key();
    }
    return answer(assertion_registry::is_stopped(state, *assertion_id));
  }
  if (path == "/attestation/get" || path == "/attestation/is_attested" ||
      path == "/attestation/is_expired") {
    auto decoded =
        encoder_.try_decode<std::tuple<assertion_id_t, address_t>>(data);
    if (!decoded) {
      return invalid_key();
    }
    const auto& [assertion_id, subject] = *decoded;
    if (path == "/attestation/get") {
      return answer(attestation_ledger::get(state, assertion_id, subject)
                        .value_or(attestation_record_t{}));
    }
    if (path == "/attestation/is_attested") {
      return answer(
          attestation_ledger::is_attested(state, assertion_id, subject, now));
    }
    return answer(
        attestation_ledger::is_expired(state, assertion_id, subject, now));
  }
  if (path == "/address/is_blocked") {
    auto address = encoder_.try_decode<address_t>(data);
    if (!address) {
      return invalid_key();
    }
    return answer(attestation_ledger::is_blocked(state, *address));
  }
  if (path == "/token/balance_of") {
    auto decoded =
        encoder_.try_decode<std::tuple<address_t, assertion_id_t>>(data);
    if (!decoded) {
      return invalid_key();
    }
    const auto& [subject, assertion_id] = *decoded;
    return answer(
        attestation_ledger::balance_of(state, subject, assertion_id, now));
  }
  if (path == "/token/is_approved_for_all") {
    return make_query_error(query_error_code::not_transferable,
                            "attestations are not transferable", data, height);
  }
  return make_query_error(query_error_code::unsupported_path,
                          fmt::format("unsupported path {}", path), data,
                          height);
}

}  // namespace notary::execution
