#include <algorithm>
#include <iterator>
#include <mandate/blake3/hash.hpp>
#include <mandate/schema/key/builder.hpp>
#include <ranges>

namespace mandate::schema::key {

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const delegation_type_t& type) {
  return write(static_cast<uint8_t>(type));
}

mandate::schema::hash32_t builder::digest() const {
  return mandate::blake3::hash(
      mandate::schema::bytes_view_t{data.data(), data.size()});
}

}  // namespace mandate::schema::key
