#pragma once
#include <notary/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: assertion record.
// A published text claim. `text`, `assertion_id` and `revoke_id` never change
// after creation; the remaining fields are governed by the controller, the
// owner and the overrider.
namespace notary::schema {

template <uint16_t Version>
struct assertion_record;

template <>
struct assertion_record<1> final {
  uint16_t version{1};
  std::string text;
  assertion_id_t assertion_id{};
  hash32_t revoke_id{};
  duration_seconds_t freshness_window{};
  duration_seconds_t expiry_window{};
  bool requires_gateway{};
  address_t gateway{};
  address_t controller{};
  bool stopped{};
};

using assertion_record_t = assertion_record<1>;

}  // namespace notary::schema
