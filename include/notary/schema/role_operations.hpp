#pragma once
#include <notary/schema/primitives.hpp>
#include <cstdint>

namespace notary::schema {

template <uint16_t Version>
struct transfer_ownership;

template <>
struct transfer_ownership<1> final {
  uint16_t version{1};
  address_t new_owner{};
};

using transfer_ownership_t = transfer_ownership<1>;

template <uint16_t Version>
struct renounce_ownership;

template <>
struct renounce_ownership<1> final {
  uint16_t version{1};
};

using renounce_ownership_t = renounce_ownership<1>;

template <uint16_t Version>
struct set_overrider;

template <>
struct set_overrider<1> final {
  uint16_t version{1};
  address_t overrider{};
};

using set_overrider_t = set_overrider<1>;

template <uint16_t Version>
struct set_tip_jar;

template <>
struct set_tip_jar<1> final {
  uint16_t version{1};
  address_t tip_jar{};
};

using set_tip_jar_t = set_tip_jar<1>;

}  // namespace notary::schema
