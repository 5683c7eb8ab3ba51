#include <covenant/common/critical.hpp>
#include <covenant/storage/rocksdb/storage.hpp>

namespace covenant::storage {

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
    covenant::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

bool storage<rocksdb_storage_tag>::contains(
    const covenant::schema::bytes_view_t& key) const {
  if (!database) {
    covenant::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return false;
  }
  if (!status.ok()) {
    spdlog::error("Failed to look up key in RocksDB: {}", status.ToString());
    covenant::common::critical("Failed to look up key in RocksDB");
  }
  return true;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const covenant::schema::bytes_view_t& prefix) const {
  if (!database) {
    covenant::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("Prefix scan failed: {}", iterator->status().ToString());
    covenant::common::critical("Failed to scan RocksDB prefix");
  }
  return entries;
}

void storage<rocksdb_storage_tag>::commit(const write_set& writes) const {
  if (!database) {
    covenant::common::critical("RocksDB database is not initialized");
  }
  if (writes.empty()) {
    return;
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : writes.entries) {
    auto put_status = batch.Put(
        detail::to_slice(covenant::schema::bytes_view_t{key.data(), key.size()}),
        detail::to_slice(
            covenant::schema::bytes_view_t{value.data(), value.size()}));
    if (!put_status.ok()) {
      covenant::common::critical("failed staging key in write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit {} write(s): {}", writes.size(),
                  write_status.ToString());
    covenant::common::critical("failed to commit write batch");
  }
}

}  // namespace covenant::storage
