#include <mandate/storage/memory/storage.hpp>

#include <algorithm>
#include <spdlog/spdlog.h>

namespace mandate::storage {

template <>
storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  spdlog::debug("Created in-memory storage '{}'", path);
  return storage<memory_storage_tag>{};
}

void storage<memory_storage_tag>::erase(
    const mandate::schema::bytes_view_t& key) {
  entries.erase(mandate::schema::make_bytes(key));
}

void storage<memory_storage_tag>::commit(const write_batch& batch) {
  for (const auto& [key, value] : batch.operations) {
    if (value.has_value()) {
      entries.insert_or_assign(key, *value);
    } else {
      entries.erase(key);
    }
  }
}

std::vector<key_value_entry_t> storage<memory_storage_tag>::list_by_prefix(
    const mandate::schema::bytes_view_t& prefix) const {
  auto out = std::vector<key_value_entry_t>{};
  auto prefix_bytes = mandate::schema::make_bytes(prefix);
  for (auto it = entries.lower_bound(prefix_bytes); it != std::end(entries);
       ++it) {
    const auto& key = it->first;
    if (key.size() < prefix_bytes.size() ||
        !std::equal(std::begin(prefix_bytes), std::end(prefix_bytes),
                    std::begin(key))) {
      break;
    }
    out.push_back(*it);
  }
  return out;
}

}  // namespace mandate::storage
