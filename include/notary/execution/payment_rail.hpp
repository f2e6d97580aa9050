#pragma once

#include <notary/schema/primitives.hpp>

namespace notary::execution {

/// A payout owed to `to` by a committed block.
struct payout final {
  notary::schema::address_t to{};
  notary::schema::amount_t amount{};
};

/// Moves value in and out of the registry. Implementations live outside the
/// state machine.
class payment_rail {
 public:
  virtual ~payment_rail() = default;

  /// Confirm that `from` handed `amount` to the registry with the transaction
  /// `transaction_id`. Runs while a block executes and may be asked again for
  /// the same transaction when a block is re-proposed. A `false` return aborts
  /// the transaction.
  virtual bool collect(const notary::schema::hash32_t& transaction_id,
                       const notary::schema::address_t& from,
                       const notary::schema::amount_t& amount) = 0;

  /// Pay out of the registry. Only invoked once the paying block is durable;
  /// a `false` return keeps the payout queued for the next commit.
  virtual bool transfer(const notary::schema::address_t& to,
                        const notary::schema::amount_t& amount) = 0;
};

/// Rail that records movements in the log and always succeeds.
class logging_payment_rail final : public payment_rail {
 public:
  bool collect(const notary::schema::hash32_t& transaction_id,
               const notary::schema::address_t& from,
               const notary::schema::amount_t& amount) override;
  bool transfer(const notary::schema::address_t& to,
                const notary::schema::amount_t& amount) override;
};

}  // namespace notary::execution
