#pragma once
#include <mandate/schema/delegation_record.hpp>
#include <mandate/schema/encoding/scale/delegation_type.hpp>
#include <scale/scale.hpp>

// Persisted layout of delegation_record<1>, in field order:
// version(u16 LE) type(u8) from(20) to(20) contract(20) token_id(32)
// rights(32) amount(32) enabled(u8).
// Declared beside the record type so the codec finds it by argument-dependent
// lookup.
namespace mandate::schema {

void encode(const delegation_record<1>& o, ::scale::Encoder& encoder);
void decode(delegation_record<1>& o, ::scale::Decoder& decoder);

}  // namespace mandate::schema
