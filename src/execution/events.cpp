#include <notary/execution/events.hpp>

#include <fmt/format.h>

namespace notary::execution::events {

std::string format(const notary::schema::address_t& address) {
  return notary::schema::to_hex(address);
}

std::string format(const notary::schema::hash32_t& hash) {
  return notary::schema::to_hex(hash);
}

std::string format(const notary::schema::amount_t& amount) {
  return amount.str();
}

std::string format(uint64_t value) {
  return fmt::format("{}", value);
}

std::string format(bool value) {
  return value ? "true" : "false";
}

void emit(call_context& context,
          std::string_view type,
          std::initializer_list<attribute> attributes) {
  auto event = notary::schema::transaction_event_t{};
  event.type = std::string{type};
  event.attributes.reserve(attributes.size());
  for (const auto& attribute : attributes) {
    event.attributes.push_back(notary::schema::transaction_event_attribute_t{
        .key = std::string{attribute.key},
        .value = attribute.value,
        .index = attribute.index});
  }
  context.events.push_back(std::move(event));
}

}  // namespace notary::execution::events
