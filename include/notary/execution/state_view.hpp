#pragma once

#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/schema/primitives.hpp>
#include <notary/storage/rocksdb/storage.hpp>
#include <map>
#include <optional>
#include <vector>

namespace notary::execution {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;
using storage_t =
    notary::storage::storage<notary::storage::rocksdb_storage_tag>;

/// Copy-on-write overlay over committed storage or over another view.
///
/// Reads fall through to the parent when a key was not touched here. Writes
/// stay local until `merge()` folds them into the parent, so discarding a
/// view discards every mutation made through it.
class state_view final {
 public:
  explicit state_view(const storage_t& storage);
  explicit state_view(state_view& parent);

  state_view(const state_view&) = delete;
  state_view& operator=(const state_view&) = delete;

  std::optional<notary::schema::bytes_t> read(
      const notary::schema::bytes_view_t& key) const;
  bool contains(const notary::schema::bytes_view_t& key) const;
  void write(const notary::schema::bytes_view_t& key,
             notary::schema::bytes_t value);
  void erase(const notary::schema::bytes_view_t& key);

  template <typename T>
  std::optional<T> get(const notary::schema::bytes_view_t& key) const {
    auto raw = read(key);
    if (!raw) {
      return std::nullopt;
    }
    return encoder_.decode<T>(notary::schema::make_bytes_view(*raw));
  }

  template <typename T>
  void put(const notary::schema::bytes_view_t& key, const T& value) {
    write(key, encoder_.encode(value));
  }

  /// Fold local mutations into the parent view. No-op for a storage root.
  void merge();

  /// Local mutations in key order, ready for an atomic storage commit.
  std::vector<notary::storage::write_entry_t> entries() const;

  encoder_t& encoder() const { return encoder_; }

 private:
  const storage_t* storage_{};
  state_view* parent_{};
  std::map<notary::schema::bytes_t, std::optional<notary::schema::bytes_t>>
      entries_;
  mutable encoder_t encoder_;
};

}  // namespace notary::execution
