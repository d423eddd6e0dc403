#include <floodgate/common/critical.hpp>
#include <floodgate/storage/rocksdb/storage.hpp>

namespace floodgate::storage {

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
    throw storage_error{"failed to open RocksDB at " + std::string{path} +
                        ": " + status.ToString()};
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

bool storage<rocksdb_storage_tag>::remove(
    const floodgate::schema::bytes_view_t& key) const {
  if (!database) {
    floodgate::common::critical("RocksDB database is not initialized");
  }
  auto existing = std::string{};
  auto lookup = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &existing);
  if (lookup.IsNotFound()) {
    return false;
  }
  if (!lookup.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", lookup.ToString());
    throw storage_error{"failed to get value from RocksDB: " +
                        lookup.ToString()};
  }
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    spdlog::error("Failed to delete value from RocksDB: {}",
                  status.ToString());
    throw storage_error{"failed to delete value from RocksDB: " +
                        status.ToString()};
  }
  return true;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const floodgate::schema::bytes_view_t& prefix) const {
  if (!database) {
    floodgate::common::critical("RocksDB database is not initialized");
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
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    throw storage_error{"RocksDB iteration failed: " +
                        iterator->status().ToString()};
  }
  return entries;
}

}  // namespace floodgate::storage
