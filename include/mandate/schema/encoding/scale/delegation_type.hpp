#pragma once

#include <mandate/schema/delegation_type.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(mandate::schema,
                             delegation_type_t,
                             mandate::schema::delegation_type_t::none,
                             mandate::schema::delegation_type_t::all,
                             mandate::schema::delegation_type_t::contract,
                             mandate::schema::delegation_type_t::erc721,
                             mandate::schema::delegation_type_t::erc20,
                             mandate::schema::delegation_type_t::erc1155)
