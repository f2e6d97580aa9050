#include <notary/common/critical.hpp>
#include <notary/storage/rocksdb/storage.hpp>

namespace notary::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    notary::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<notary::schema::bytes_t> storage<rocksdb_storage_tag>::read(
    const notary::schema::bytes_view_t& key) const {
  if (!database) {
    notary::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    notary::common::critical("Failed to get value from RocksDB");
  }
  return notary::schema::make_bytes(std::string_view{value});
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  auto raw = read(notary::schema::make_bytes_view(detail::kCommittedStateKey));
  if (!raw) {
    return std::nullopt;
  }

  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<
      std::tuple<int64_t, uint64_t, notary::schema::hash32_t>>(
      notary::schema::make_bytes_view(*raw));
  if (!decoded.has_value()) {
    notary::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .block_time = std::get<1>(decoded.value()),
                         .state_root = std::get<2>(decoded.value())};
}

void storage<rocksdb_storage_tag>::commit(
    const std::vector<write_entry_t>& entries,
    const committed_state& state) const {
  if (!database) {
    notary::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto status = value ? batch.Put(detail::to_slice(key),
                                    detail::to_slice(*value))
                        : batch.Delete(detail::to_slice(key));
    if (!status.ok()) {
      notary::common::critical("failed staging key for commit: {}",
                               status.ToString());
    }
  }

  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(
      std::tuple{state.height, state.block_time, state.state_root});
  auto state_status = batch.Put(
      detail::to_slice(
          notary::schema::make_bytes_view(detail::kCommittedStateKey)),
      detail::to_slice(encoded));
  if (!state_status.ok()) {
    notary::common::critical("failed staging committed state");
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    notary::common::critical("failed to commit block: {}",
                             write_status.ToString());
  }
}

}  // namespace notary::storage
