#pragma once

#include <mandate/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: delegation type.
// Granularity of a grant. `none` is the lookup-miss sentinel and is never
// persisted.
namespace mandate::schema {

enum class delegation_type_t : uint8_t {
  none = 0,
  all = 1,
  contract = 2,
  erc721 = 3,
  erc20 = 4,
  erc1155 = 5
};

inline constexpr auto kDelegationTypeMappings =
    enum_mappings_t<delegation_type_t, 6>{{
        {"none", delegation_type_t::none},
        {"all", delegation_type_t::all},
        {"contract", delegation_type_t::contract},
        {"erc721", delegation_type_t::erc721},
        {"erc20", delegation_type_t::erc20},
        {"erc1155", delegation_type_t::erc1155},
    }};

template <>
inline std::optional<delegation_type_t> try_from_string<delegation_type_t>(
    const std::string_view value) {
  return from_string(value, kDelegationTypeMappings);
}

inline constexpr std::string_view to_string(const delegation_type_t value) {
  return to_string(value, kDelegationTypeMappings).value_or("unknown");
}

}  // namespace mandate::schema
