#pragma once
#include <mandate/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace mandate::storage {

using key_value_entry_t =
    std::pair<mandate::schema::bytes_t, mandate::schema::bytes_t>;

/// Puts and erases applied together by `storage<Library>::commit`, in order.
struct write_batch final {
  struct operation final {
    mandate::schema::bytes_t key;
    // std::nullopt erases the key.
    std::optional<mandate::schema::bytes_t> value;
  };

  std::vector<operation> operations;

  template <typename T, typename Encoder>
  void put(const Encoder& encoder,
           const mandate::schema::bytes_view_t& key,
           const T& value) {
    operations.push_back(
        operation{mandate::schema::make_bytes(key), encoder.encode(value)});
  }

  void erase(const mandate::schema::bytes_view_t& key) {
    operations.push_back(
        operation{mandate::schema::make_bytes(key), std::nullopt});
  }

  bool empty() const { return operations.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(const Encoder& encoder,
                       const mandate::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(const Encoder& encoder,
           const mandate::schema::bytes_view_t& key,
           const T& value);

  /// Remove key if present.
  void erase(const mandate::schema::bytes_view_t& key);

  /// Apply every operation of `batch` atomically: all or none are visible.
  void commit(const write_batch& batch);

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const mandate::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace mandate::storage
