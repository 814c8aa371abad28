#include <ferry/common/critical.hpp>
#include <ferry/storage/rocksdb/storage.hpp>

#include <limits>

namespace ferry::storage {

namespace {

void require_open(const std::unique_ptr<ROCKSDB_NAMESPACE::DB>& database) {
  if (!database) {
    ferry::common::critical("RocksDB database is not initialized");
  }
}

}  // namespace

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
    ferry::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<ferry::schema::bytes_t> storage<rocksdb_storage_tag>::get_raw(
    const ferry::schema::bytes_view_t& key) const {
  require_open(database);
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    ferry::common::critical("Failed to get value from RocksDB");
  }
  return ferry::schema::make_bytes(value);
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const ferry::schema::bytes_view_t& prefix) const {
  return list_from(prefix, prefix, std::numeric_limits<std::size_t>::max());
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_from(
    const ferry::schema::bytes_view_t& prefix,
    const ferry::schema::bytes_view_t& from,
    const std::size_t limit) const {
  require_open(database);

  auto entries = std::vector<key_value_entry_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  iterator->Seek(detail::to_slice(from));
  while (iterator->Valid() && entries.size() < limit) {
    if (!detail::starts_with(iterator->key(), prefix)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    ferry::common::critical("RocksDB iteration failed");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit(
    const std::vector<key_value_entry_t>& writes) const {
  require_open(database);
  if (writes.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes) {
    auto put_status = batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      ferry::common::critical("failed staging write batch entry");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}", status.ToString());
    ferry::common::critical("Failed to commit RocksDB batch");
  }
}

}  // namespace ferry::storage
