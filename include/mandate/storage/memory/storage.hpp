#pragma once
#include <mandate/storage/storage.hpp>
#include <map>
#include <string_view>

namespace mandate::storage {

/// Process-local ordered key/value backend. Same contract as the RocksDB
/// backend without durability.
struct memory_storage_tag {};

template <>
struct storage<memory_storage_tag> final {
  std::map<mandate::schema::bytes_t, mandate::schema::bytes_t> entries;

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

/// `path` is ignored.
template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<memory_storage_tag>::get(
    const Encoder& encoder,
    const mandate::schema::bytes_view_t& key) const {
  auto found = entries.find(mandate::schema::make_bytes(key));
  if (found == std::end(entries)) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(mandate::schema::bytes_view_t{
      found->second.data(), found->second.size()})};
}

template <typename T, typename Encoder>
void storage<memory_storage_tag>::put(
    const Encoder& encoder,
    const mandate::schema::bytes_view_t& key,
    const T& value) {
  entries.insert_or_assign(mandate::schema::make_bytes(key),
                           encoder.encode(value));
}

}  // namespace mandate::storage
