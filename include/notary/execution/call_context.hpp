#pragma once

#include <notary/crypto/typed_data.hpp>
#include <notary/execution/payment_rail.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction_error_code.hpp>
#include <notary/schema/transaction_event.hpp>
#include <optional>
#include <string>
#include <vector>

namespace notary::execution {

/// Inputs and outputs of a single module operation.
struct call_context final {
  notary::schema::address_t caller{};
  notary::schema::amount_t value{};
  notary::schema::timestamp_seconds_t now{};
  notary::crypto::domain_t domain{};
  // Hash of the raw transaction bytes.
  notary::schema::hash32_t transaction_id{};
  payment_rail* rail{nullptr};
  std::vector<notary::schema::transaction_event_t> events;
  // Released by the engine after the block commits.
  std::vector<payout> payouts;
};

struct operation_error final {
  notary::schema::transaction_error_code code{};
  std::string message;
};

/// std::nullopt on success.
using operation_result_t = std::optional<operation_error>;

inline operation_error make_error(notary::schema::transaction_error_code code,
                                  std::string message) {
  return operation_error{.code = code, .message = std::move(message)};
}

}  // namespace notary::execution
