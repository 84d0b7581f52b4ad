#pragma once

#include <cstdint>

// Schema type: delegation error code.
// Registry failure taxonomy: stable numeric codes for rejected mutations.
namespace mandate::schema {

enum class delegation_error_code : uint32_t {
  invalid_delegation_type = 1,
  self_delegation = 2,
  invalid_scope = 3,
  unauthorized = 4,
};

}  // namespace mandate::schema
