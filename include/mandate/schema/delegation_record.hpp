#pragma once
#include <mandate/schema/delegation_type.hpp>
#include <mandate/schema/primitives.hpp>

// Schema type: delegation record.
// Registry state: one granted (or formerly granted) authority, stored under
// its identity and never physically deleted.
namespace mandate::schema {

template <uint16_t Version>
struct delegation_record;

template <>
struct delegation_record<1> final {
  uint16_t version{1};
  delegation_type_t type{delegation_type_t::none};
  address_t from{};
  address_t to{};
  address_t contract{};
  word_t token_id{};
  rights_t rights{};
  word_t amount{};
  bool enabled{};

  bool operator==(const delegation_record<1>&) const = default;
};

using delegation_record_t = delegation_record<1>;

}  // namespace mandate::schema
