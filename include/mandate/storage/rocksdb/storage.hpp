#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <mandate/common/critical.hpp>
#include <mandate/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace mandate::storage {

namespace detail {

inline mandate::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const mandate::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(const Encoder& encoder,
                       const mandate::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(const Encoder& encoder,
           const mandate::schema::bytes_view_t& key,
           const T& value);

  void erase(const mandate::schema::bytes_view_t& key);

  void commit(const write_batch& batch);

  std::vector<key_value_entry_t> list_by_prefix(
      const mandate::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    const Encoder& encoder,
    const mandate::schema::bytes_view_t& key) const {
  if (!database) {
    mandate::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    }
    mandate::common::critical("Failed to get value from RocksDB",
                              status.ToString());
  }
  return {encoder.template decode<T>(mandate::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    const Encoder& encoder,
    const mandate::schema::bytes_view_t& key,
    const T& value) {
  if (!database) {
    mandate::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(mandate::schema::bytes_view_t{encoded_value.data(),
                                                     encoded_value.size()}));
  if (!status.ok()) {
    mandate::common::critical("Failed to put value into RocksDB",
                              status.ToString());
  }
}

}  // namespace mandate::storage
