#pragma once
#include <mandate/schema/delegation_type.hpp>
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

namespace mandate::schema::key {

/// Append-only byte builder for storage keys and identity preimages.
struct builder final {
  mandate::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const delegation_type_t& type);

  template <std::size_t N>
  builder& write(const std::array<uint8_t, N>& value) {
    return write(std::span<const uint8_t>{value.data(), value.size()});
  }

  template <typename T, typename = std::enable_if_t<std::is_integral_v<T>>>
  builder& write(T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
      data.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
    return *this;
  }

  /// BLAKE3 digest of the accumulated bytes.
  mandate::schema::hash32_t digest() const;
};

}  // namespace mandate::schema::key
