#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mandate::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using rights_t = hash32_t;
using identity_t = hash32_t;
// Big-endian 256-bit word, the persisted form of token ids and amounts.
using word_t = std::array<uint8_t, 32>;
using uint256_t = boost::multiprecision::uint256_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
bytes_t from_hex(std::string_view hex);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

address_t make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_zero_address();

word_t to_word(const uint256_t& value);
uint256_t from_word(const word_t& word);
uint256_t max_uint256();

/// Canonical base-10 digits only: no sign, no radix prefix, no leading zero,
/// at most max_uint256().
std::optional<uint256_t> try_parse_uint256(std::string_view decimal);

template <std::size_t N>
bool is_zero(const std::array<uint8_t, N>& value) {
  for (const auto byte : value) {
    if (byte != 0) {
      return false;
    }
  }
  return true;
}

template <std::size_t N>
std::string to_hex(const std::array<uint8_t, N>& value) {
  return to_hex(bytes_view_t{value.data(), value.size()});
}

}  // namespace mandate::schema
