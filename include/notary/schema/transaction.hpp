#pragma once
#include <notary/schema/assertion_operations.hpp>
#include <notary/schema/attestation_operations.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/role_operations.hpp>
#include <notary/schema/tip_operations.hpp>
#include <notary/schema/token_operations.hpp>
#include <variant>

namespace notary::schema {

using transaction_payload_t = std::variant<add_assertion_t,
                                           set_controller_t,
                                           set_gateway_t,
                                           stop_assertion_t,
                                           unstop_assertion_t,
                                           attest_t,
                                           revoke_t,
                                           force_attest_t,
                                           force_revoke_t,
                                           block_address_t,
                                           unblock_address_t,
                                           set_tip_amount_t,
                                           tip_out_t,
                                           set_overrider_t,
                                           set_tip_jar_t,
                                           transfer_ownership_t,
                                           renounce_ownership_t,
                                           deposit_t,
                                           safe_transfer_from_t,
                                           safe_batch_transfer_from_t,
                                           set_approval_for_all_t>;

template <uint16_t Version>
struct transaction;

template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  uint64_t nonce{};
  address_t sender{};
  // Value attached to the call; only add_assertion and deposit accept it.
  amount_t value{};
  transaction_payload_t payload{};
  signature_t signature{};
};

using transaction_t = transaction<1>;

}  // namespace notary::schema
