#include <mandate/schema/encoding/scale/delegation_record.hpp>

namespace mandate::schema {

void encode(const delegation_record<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.type, encoder);
  encode(o.from, encoder);
  encode(o.to, encoder);
  encode(o.contract, encoder);
  encode(o.token_id, encoder);
  encode(o.rights, encoder);
  encode(o.amount, encoder);
  encode(o.enabled, encoder);
}

void decode(delegation_record<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.type, decoder);
  decode(o.from, decoder);
  decode(o.to, decoder);
  decode(o.contract, decoder);
  decode(o.token_id, decoder);
  decode(o.rights, decoder);
  decode(o.amount, decoder);
  decode(o.enabled, decoder);
}

}  // namespace mandate::schema
