#include <notary/schema/transaction_error_code.hpp>

namespace notary::schema {

error_category category_of(transaction_error_code code) {
  using enum transaction_error_code;
  switch (code) {
    case invalid_transaction:
    case unsupported_transaction_version:
    case invalid_chain_id:
    case invalid_nonce:
    case invalid_sender:
    case signature_verification_failed:
      return error_category::envelope;
    case non_payable:
    case empty_assertion:
    case duplicate_assertion:
    case zero_address:
      return error_category::validation;
    case unknown_assertion:
      return error_category::unknown_assertion;
    case not_authorized:
    case gateway_required:
      return error_category::not_authorized;
    case assertion_stopped:
    case already_stopped_or_unknown:
    case not_stopped:
    case address_blocked:
    case already_blocked:
    case not_blocked:
      return error_category::state;
    case invalid_signature:
    case signature_expired:
      return error_category::signature;
    case insufficient_tip:
      return error_category::insufficient_tip;
    case not_transferable:
      return error_category::not_transferable;
    case transfer_failed:
      return error_category::transfer;
  }
  return error_category::envelope;
}

std::string_view to_string(transaction_error_code code) {
  using enum transaction_error_code;
  switch (code) {
    case invalid_transaction:
      return "invalid_transaction";
    case unsupported_transaction_version:
      return "unsupported_transaction_version";
    case invalid_chain_id:
      return "invalid_chain_id";
    case invalid_nonce:
      return "invalid_nonce";
    case invalid_sender:
      return "invalid_sender";
    case signature_verification_failed:
      return "signature_verification_failed";
    case non_payable:
      return "non_payable";
    case empty_assertion:
      return "empty_assertion";
    case duplicate_assertion:
      return "duplicate_assertion";
    case zero_address:
      return "zero_address";
    case unknown_assertion:
      return "unknown_assertion";
    case not_authorized:
      return "not_authorized";
    case gateway_required:
      return "gateway_required";
    case assertion_stopped:
      return "assertion_stopped";
    case already_stopped_or_unknown:
      return "already_stopped_or_unknown";
    case not_stopped:
      return "not_stopped";
    case address_blocked:
      return "address_blocked";
    case already_blocked:
      return "already_blocked";
    case not_blocked:
      return "not_blocked";
    case invalid_signature:
      return "invalid_signature";
    case signature_expired:
      return "signature_expired";
    case insufficient_tip:
      return "insufficient_tip";
    case not_transferable:
      return "not_transferable";
    case transfer_failed:
      return "transfer_failed";
  }
  return "unknown";
}

std::string_view to_string(error_category category) {
  switch (category) {
    case error_category::envelope:
      return "envelope";
    case error_category::validation:
      return "validation";
    case error_category::unknown_assertion:
      return "unknown_assertion";
    case error_category::not_authorized:
      return "not_authorized";
    case error_category::state:
      return "state";
    case error_category::signature:
      return "signature";
    case error_category::insufficient_tip:
      return "insufficient_tip";
    case error_category::not_transferable:
      return "not_transferable";
    case error_category::transfer:
      return "transfer";
  }
  return "unknown";
}

}  // namespace notary::schema
