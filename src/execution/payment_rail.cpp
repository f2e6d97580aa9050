#include <notary/execution/payment_rail.hpp>

#include <spdlog/spdlog.h>

namespace notary::execution {

bool logging_payment_rail::collect(
    const notary::schema::hash32_t& transaction_id,
    const notary::schema::address_t& from,
    const notary::schema::amount_t& amount) {
  spdlog::info("Collecting {} from {} for tx {}", amount.str(),
               notary::schema::to_hex(from),
               notary::schema::to_hex(transaction_id));
  return true;
}

bool logging_payment_rail::transfer(const notary::schema::address_t& to,
                                    const notary::schema::amount_t& amount) {
  spdlog::info("Paying out {} to {}", amount.str(), notary::schema::to_hex(to));
  return true;
}

}  // namespace notary::execution
