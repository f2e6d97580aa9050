#pragma once

#include <cstdint>
#include <string>

// Schema type: transaction event attribute.
// Key/value pair of an emitted event. `index` marks attributes a consumer may
// filter on.
namespace notary::schema {

template <uint16_t Version>
struct transaction_event_attribute;

template <>
struct transaction_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using transaction_event_attribute_t = transaction_event_attribute<1>;

}  // namespace notary::schema
