#pragma once

#include <cstdint>
#include <string_view>

namespace notary::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  invalid_nonce = 4,
  invalid_sender = 5,
  signature_verification_failed = 6,
  non_payable = 7,
  empty_assertion = 10,
  duplicate_assertion = 11,
  zero_address = 12,
  unknown_assertion = 20,
  not_authorized = 30,
  gateway_required = 31,
  assertion_stopped = 40,
  already_stopped_or_unknown = 41,
  not_stopped = 42,
  address_blocked = 43,
  already_blocked = 44,
  not_blocked = 45,
  invalid_signature = 50,
  signature_expired = 51,
  insufficient_tip = 60,
  not_transferable = 70,
  transfer_failed = 80,
};

/// Coarse failure taxonomy reported as the result codespace.
enum class error_category : uint8_t {
  envelope,
  validation,
  unknown_assertion,
  not_authorized,
  state,
  signature,
  insufficient_tip,
  not_transferable,
  transfer,
};

error_category category_of(transaction_error_code code);

std::string_view to_string(transaction_error_code code);
std::string_view to_string(error_category category);

}  // namespace notary::schema
