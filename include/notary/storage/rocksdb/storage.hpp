#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <notary/common/critical.hpp>
#include <notary/schema/encoding/scale/encoder.hpp>
#include <notary/storage/storage.hpp>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>
#include <tuple>

namespace notary::storage {

namespace detail {

using encoder_t = notary::schema::encoding::encoder<
    notary::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const notary::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const notary::schema::bytes_view_t& key);

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const notary::schema::bytes_view_t& key,
           const T& value);

  std::optional<notary::schema::bytes_t> read(
      const notary::schema::bytes_view_t& key) const;
  std::optional<committed_state> load_committed_state() const;
  void commit(const std::vector<write_entry_t>& entries,
              const committed_state& state) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const notary::schema::bytes_view_t& key) {
  auto value = read(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      notary::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const notary::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    notary::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(notary::schema::make_bytes_view(encoded_value)));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    notary::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace notary::storage
