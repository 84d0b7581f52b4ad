#pragma once

#include <mandate/schema/delegation_type.hpp>
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: delegation event.
// Audit stream item: one `delegation_changed` emission per accepted
// set_delegation call.
namespace mandate::schema {

template <uint16_t Version>
struct delegation_event_attribute;

template <>
struct delegation_event_attribute<1> final {
  uint16_t version{1};
  std::string key;
  std::string value;
  bool index{};
};

using delegation_event_attribute_t = delegation_event_attribute<1>;

template <uint16_t Version>
struct delegation_event;

template <>
struct delegation_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<delegation_event_attribute_t> attributes;
};

using delegation_event_t = delegation_event<1>;

}  // namespace mandate::schema
