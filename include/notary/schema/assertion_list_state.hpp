#pragma once
#include <notary/schema/primitives.hpp>
#include <cstdint>

// Schema type: assertion list state.
// Length of the append-only assertion list and the block time of the last
// append.
namespace notary::schema {

template <uint16_t Version>
struct assertion_list_state;

template <>
struct assertion_list_state<1> final {
  uint16_t version{1};
  uint64_t count{};
  timestamp_seconds_t last_update{};
};

using assertion_list_state_t = assertion_list_state<1>;

}  // namespace notary::schema
