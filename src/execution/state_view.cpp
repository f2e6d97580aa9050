#include <notary/execution/state_view.hpp>

#include <iterator>

namespace notary::execution {

state_view::state_view(const storage_t& storage) : storage_{&storage} {}

state_view::state_view(state_view& parent) : parent_{&parent} {}

std::optional<notary::schema::bytes_t> state_view::read(
    const notary::schema::bytes_view_t& key) const {
  auto it = entries_.find(notary::schema::make_bytes(key));
  if (it != std::end(entries_)) {
    return it->second;
  }
  if (parent_ != nullptr) {
    return parent_->read(key);
  }
  return storage_->read(key);
}

bool state_view::contains(const notary::schema::bytes_view_t& key) const {
  return read(key).has_value();
}

void state_view::write(const notary::schema::bytes_view_t& key,
                       notary::schema::bytes_t value) {
  entries_.insert_or_assign(notary::schema::make_bytes(key), std::move(value));
}

void state_view::erase(const notary::schema::bytes_view_t& key) {
  entries_.insert_or_assign(notary::schema::make_bytes(key), std::nullopt);
}

void state_view::merge() {
  if (parent_ == nullptr) {
    return;
  }
  for (auto& [key, value] : entries_) {
    parent_->entries_.insert_or_assign(key, std::move(value));
  }
  entries_.clear();
}

std::vector<notary::storage::write_entry_t> state_view::entries() const {
  return {std::begin(entries_), std::end(entries_)};
}

}  // namespace notary::execution
