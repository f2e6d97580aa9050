#pragma once

#include <notary/crypto/typed_data.hpp>
#include <notary/execution/call_context.hpp>
#include <notary/execution/payment_rail.hpp>
#include <notary/execution/signature_verifier.hpp>
#include <notary/execution/state_view.hpp>
#include <notary/schema/app_info.hpp>
#include <notary/schema/block_result.hpp>
#include <notary/schema/commit_result.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/query_result.hpp>
#include <notary/schema/transaction.hpp>
#include <notary/schema/transaction_result.hpp>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace notary::execution {

/// Values applied once, when the database holds no role state yet.
struct genesis_config final {
  notary::schema::hash32_t chain_id{};
  notary::schema::address_t registry_address{};
  notary::schema::address_t owner{};
  // Defaults to the zero address: only the owner may appoint one.
  std::optional<notary::schema::address_t> overrider;
  // Defaults to the owner.
  std::optional<notary::schema::address_t> tip_jar;
  notary::schema::amount_t tip_amount{};
};

/// Deterministic attestation registry state machine.
///
/// Every public entry point is serialized on one mutex. Transactions run in
/// their own overlay on top of the block overlay, so a failed transaction
/// leaves no trace besides its consumed nonce.
class engine final {
 public:
  /// `require_strict_crypto` enables envelope signature checks; when false,
  /// the envelope sender is trusted as-is. Attestation signatures are always
  /// verified.
  engine(encoder_t& encoder,
         storage_t& storage,
         const genesis_config& genesis,
         payment_rail& rail,
         bool require_strict_crypto = true);

  /// Admit a transaction for mempool inclusion. Decodes and validates the
  /// envelope against committed state; never mutates state.
  notary::schema::transaction_result_t check_transaction(
      const notary::schema::bytes_view_t& raw_tx);

  /// Execute a candidate block at `block_time` and compute its state root.
  ///
  /// Transactions are processed in order; per-tx results are returned even on
  /// failures.
  notary::schema::block_result_t finalize_block(
      uint64_t height,
      notary::schema::timestamp_seconds_t block_time,
      const std::vector<notary::schema::bytes_t>& txs);

  /// Persist the last finalized block in one atomic write, then release its
  /// payouts to the payment rail. Payouts the rail refuses stay queued and are
  /// retried on the next commit.
  notary::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state root).
  notary::schema::app_info_t info() const;

  /// Execute a read-path query against committed state.
  notary::schema::query_result_t query(std::string_view path,
                                       const notary::schema::bytes_view_t& data);

  /// Typed-data domain attestation signatures are checked against.
  const notary::crypto::domain_t& domain() const { return domain_; }

  /// Install the envelope signature verifier. Ignored when strict-crypto mode
  /// is disabled.
  void set_signature_verifier(signature_verifier_t verifier);

 private:
  /// Validate version, chain, sender, nonce and signature of an envelope.
  std::optional<operation_error> validate_transaction(
      const state_view& state,
      const notary::schema::transaction_t& tx,
      bool exact_nonce) const;

  /// Dispatch the payload to its module operation.
  operation_result_t execute_operation(call_context& context,
                                       state_view& state,
                                       const notary::schema::transaction_t& tx);

  void apply_genesis(const genesis_config& genesis);
  void release_payouts();
  notary::schema::app_info_t make_info() const;

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  payment_rail& rail_;
  notary::crypto::domain_t domain_;
  bool require_strict_crypto_{true};
  signature_verifier_t signature_verifier_;
  int64_t last_committed_height_{};
  notary::schema::timestamp_seconds_t last_committed_time_{};
  notary::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  notary::schema::timestamp_seconds_t pending_time_{};
  notary::schema::hash32_t pending_state_root_{};
  std::unique_ptr<state_view> pending_state_;
  std::vector<payout> pending_payouts_;
  std::vector<payout> undelivered_payouts_;
};

}  // namespace notary::execution
