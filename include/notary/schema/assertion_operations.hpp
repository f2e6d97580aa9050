#pragma once
#include <notary/schema/primitives.hpp>
#include <cstdint>
#include <string>

namespace notary::schema {

template <uint16_t Version>
struct add_assertion;

template <>
struct add_assertion<1> final {
  uint16_t version{1};
  std::string text;
  duration_seconds_t freshness_window{};
  duration_seconds_t expiry_window{};
  bool requires_gateway{};
  address_t gateway{};
  address_t controller{};
};

using add_assertion_t = add_assertion<1>;

template <uint16_t Version>
struct set_controller;

template <>
struct set_controller<1> final {
  uint16_t version{1};
  assertion_id_t assertion_id{};
  address_t controller{};
};

using set_controller_t = set_controller<1>;

template <uint16_t Version>
struct set_gateway;

template <>
struct set_gateway<1> final {
  uint16_t version{1};
  assertion_id_t assertion_id{};
  address_t gateway{};
};

using set_gateway_t = set_gateway<1>;

template <uint16_t Version>
struct stop_assertion;

template <>
struct stop_assertion<1> final {
  uint16_t version{1};
  assertion_id_t assertion_id{};
};

using stop_assertion_t = stop_assertion<1>;

template <uint16_t Version>
struct unstop_assertion;

template <>
struct unstop_assertion<1> final {
  uint16_t version{1};
  assertion_id_t assertion_id{};
};

using unstop_assertion_t = unstop_assertion<1>;

}  // namespace notary::schema
