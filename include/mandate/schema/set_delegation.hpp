#pragma once
#include <mandate/schema/delegation_type.hpp>
#include <mandate/schema/primitives.hpp>

// Schema type: set delegation.
// Registry operation: grant (enable = true) or revoke (enable = false) one
// delegation scope on behalf of `from`.
namespace mandate::schema {

template <uint16_t Version>
struct set_delegation;

template <>
struct set_delegation<1> final {
  uint16_t version{1};
  delegation_type_t type{delegation_type_t::none};
  address_t from{};
  address_t to{};
  address_t contract{};
  uint256_t token_id{};
  rights_t rights{};
  uint256_t amount{};
  bool enable{};
};

using set_delegation_t = set_delegation<1>;

}  // namespace mandate::schema
