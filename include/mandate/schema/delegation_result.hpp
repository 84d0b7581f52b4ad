#pragma once

#include <mandate/schema/delegation_event.hpp>
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace mandate::schema {

template <uint16_t Version>
struct delegation_result;

template <>
struct delegation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  identity_t identity{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<delegation_event_t> events;
};

using delegation_result_t = delegation_result<1>;

}  // namespace mandate::schema
