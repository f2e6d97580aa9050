#pragma once
#include <notary/schema/primitives.hpp>
#include <cstdint>

namespace notary::schema {

template <uint16_t Version>
struct set_tip_amount;

template <>
struct set_tip_amount<1> final {
  uint16_t version{1};
  amount_t tip_amount{};
};

using set_tip_amount_t = set_tip_amount<1>;

template <uint16_t Version>
struct tip_out;

template <>
struct tip_out<1> final {
  uint16_t version{1};
};

using tip_out_t = tip_out<1>;

// Plain value transfer into the tip balance; the amount is the envelope value.
template <uint16_t Version>
struct deposit;

template <>
struct deposit<1> final {
  uint16_t version{1};
};

using deposit_t = deposit<1>;

}  // namespace notary::schema
