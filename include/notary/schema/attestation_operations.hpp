#pragma once
#include <notary/schema/primitives.hpp>
#include <cstdint>

namespace notary::schema {

template <uint16_t Version>
struct attest;

template <>
struct attest<1> final {
  uint16_t version{1};
  assertion_id_t assertion_id{};
  address_t subject{};
  timestamp_seconds_t signed_at{};
  signature_t signature{};
};

using attest_t = attest<1>;

template <uint16_t Version>
struct revoke;

template <>
struct revoke<1> final {
  uint16_t version{1};
  assertion_id_t assertion_id{};
  address_t subject{};
  timestamp_seconds_t signed_at{};
  signature_t signature{};
};

using revoke_t = revoke<1>;

template <uint16_t Version>
struct force_attest;

template <>
struct force_attest<1> final {
  uint16_t version{1};
  assertion_id_t assertion_id{};
  address_t subject{};
  timestamp_seconds_t signed_at{};
};

using force_attest_t = force_attest<1>;

template <uint16_t Version>
struct force_revoke;

template <>
struct force_revoke<1> final {
  uint16_t version{1};
  assertion_id_t assertion_id{};
  address_t subject{};
};

using force_revoke_t = force_revoke<1>;

template <uint16_t Version>
struct block_address;

template <>
struct block_address<1> final {
  uint16_t version{1};
  address_t address{};
};

using block_address_t = block_address<1>;

template <uint16_t Version>
struct unblock_address;

template <>
struct unblock_address<1> final {
  uint16_t version{1};
  address_t address{};
};

using unblock_address_t = unblock_address<1>;

}  // namespace notary::schema
