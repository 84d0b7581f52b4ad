#pragma once
#include <mandate/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace mandate::blake3 {

mandate::schema::hash32_t hash(const std::string_view& str);
mandate::schema::hash32_t hash(const mandate::schema::bytes_view_t& bytes);

}  // namespace mandate::blake3
