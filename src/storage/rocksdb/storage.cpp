#include <mandate/common/critical.hpp>
#include <mandate/storage/rocksdb/storage.hpp>

namespace mandate::storage {

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
    spdlog::error("Failed to open RocksDB at {}", path);
    mandate::common::critical("Failed to open RocksDB", status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::erase(
    const mandate::schema::bytes_view_t& key) {
  if (!database) {
    mandate::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Delete(ROCKSDB_NAMESPACE::WriteOptions{},
                                 detail::to_slice(key));
  if (!status.ok()) {
    mandate::common::critical("Failed to delete key from RocksDB",
                              status.ToString());
  }
}

void storage<rocksdb_storage_tag>::commit(const write_batch& batch) {
  if (!database) {
    mandate::common::critical("RocksDB database is not initialized");
  }
  if (batch.empty()) {
    return;
  }

  auto rocksdb_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : batch.operations) {
    auto key_slice =
        detail::to_slice(mandate::schema::bytes_view_t{key.data(), key.size()});
    auto status =
        value.has_value()
            ? rocksdb_batch.Put(key_slice,
                                detail::to_slice(mandate::schema::bytes_view_t{
                                    value->data(), value->size()}))
            : rocksdb_batch.Delete(key_slice);
    if (!status.ok()) {
      mandate::common::critical("Failed to stage RocksDB batch operation",
                                status.ToString());
    }
  }

  auto status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &rocksdb_batch);
  if (!status.ok()) {
    mandate::common::critical("Failed to commit RocksDB batch",
                              status.ToString());
  }
  spdlog::trace("Committed RocksDB batch of {} operation(s)",
                batch.operations.size());
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const mandate::schema::bytes_view_t& prefix) const {
  if (!database) {
    mandate::common::critical("RocksDB database is not initialized");
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
    mandate::common::critical("RocksDB iteration failed",
                              iterator->status().ToString());
  }
  return entries;
}

}  // namespace mandate::storage
