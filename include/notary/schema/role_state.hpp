#pragma once
#include <notary/schema/primitives.hpp>
#include <cstdint>

// Schema type: role state.
// Registry-wide roles and the minimum tip for publishing an assertion.
namespace notary::schema {

template <uint16_t Version>
struct role_state;

template <>
struct role_state<1> final {
  uint16_t version{1};
  address_t owner{};
  address_t overrider{};
  address_t tip_jar{};
  amount_t tip_amount{};
};

using role_state_t = role_state<1>;

}  // namespace notary::schema
