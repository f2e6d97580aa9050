#pragma once
#include <notary/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema types: token transfer surface.
// Attestations are exposed through a multi-token balance view but can never
// move between holders. These payloads decode so they can be rejected with a
// stable error.
namespace notary::schema {

template <uint16_t Version>
struct safe_transfer_from;

template <>
struct safe_transfer_from<1> final {
  uint16_t version{1};
  address_t from{};
  address_t to{};
  assertion_id_t id{};
  amount_t amount{};
  bytes_t data;
};

using safe_transfer_from_t = safe_transfer_from<1>;

template <uint16_t Version>
struct safe_batch_transfer_from;

template <>
struct safe_batch_transfer_from<1> final {
  uint16_t version{1};
  address_t from{};
  address_t to{};
  std::vector<assertion_id_t> ids;
  std::vector<amount_t> amounts;
  bytes_t data;
};

using safe_batch_transfer_from_t = safe_batch_transfer_from<1>;

template <uint16_t Version>
struct set_approval_for_all;

template <>
struct set_approval_for_all<1> final {
  uint16_t version{1};
  address_t operator_address{};
  bool approved{};
};

using set_approval_for_all_t = set_approval_for_all<1>;

}  // namespace notary::schema
