#pragma once

#include <notary/execution/call_context.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/schema/transaction_event.hpp>
#include <initializer_list>
#include <string>
#include <string_view>

namespace notary::execution::events {

struct attribute final {
  std::string_view key;
  std::string value;
  bool index{};
};

std::string format(const notary::schema::address_t& address);
std::string format(const notary::schema::hash32_t& hash);
std::string format(const notary::schema::amount_t& amount);
std::string format(uint64_t value);
std::string format(bool value);

/// Append an event named `type` to the call's event list.
void emit(call_context& context,
          std::string_view type,
          std::initializer_list<attribute> attributes);

}  // namespace notary::execution::events
