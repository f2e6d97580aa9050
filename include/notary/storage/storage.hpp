#pragma once
#include <notary/schema/primitives.hpp>
#include <optional>
#include <utility>
#include <vector>

namespace notary::storage {

/// One staged mutation. An empty value deletes the key.
using write_entry_t =
    std::pair<notary::schema::bytes_t, std::optional<notary::schema::bytes_t>>;

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  notary::schema::timestamp_seconds_t block_time{};
  notary::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const notary::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const notary::schema::bytes_view_t& key,
           const T& value);

  /// Raw bytes at key, or std::nullopt when missing.
  std::optional<notary::schema::bytes_t> read(
      const notary::schema::bytes_view_t& key) const;

  /// Load the most recent committed checkpoint.
  std::optional<committed_state> load_committed_state() const;

  /// Atomically write `entries` together with the new checkpoint.
  void commit(const std::vector<write_entry_t>& entries,
              const committed_state& state) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace notary::storage
