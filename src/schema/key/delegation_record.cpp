#include <mandate/schema/key/builder.hpp>
#include <mandate/schema/key/delegation_record.hpp>

namespace mandate::schema::key {

identity_t make_identity(const delegation_type_t type,
                         const address_t& from,
                         const address_t& to,
                         const address_t& contract,
                         const word_t& token_id,
                         const rights_t& rights) {
  auto b = builder{};
  b.write(kIdentityDomain);
  b.write(type);
  b.write(from);
  b.write(to);
  b.write(contract);
  b.write(token_id);
  b.write(rights);
  return b.digest();
}

identity_t make_identity(const delegation_record_t& record) {
  return make_identity(record.type, record.from, record.to, record.contract,
                       record.token_id, record.rights);
}

bytes_t make_record_key(const identity_t& identity) {
  auto b = builder{};
  b.write(kDelegationPrefix);
  b.write(identity);
  return b.data;
}

bytes_t make_outgoing_prefix(const address_t& from) {
  auto b = builder{};
  b.write(kOutgoingPrefix);
  b.write(from);
  return b.data;
}

bytes_t make_outgoing_key(const address_t& from, const identity_t& identity) {
  auto b = builder{make_outgoing_prefix(from)};
  b.write(identity);
  return b.data;
}

bytes_t make_incoming_prefix(const address_t& to) {
  auto b = builder{};
  b.write(kIncomingPrefix);
  b.write(to);
  return b.data;
}

bytes_t make_incoming_key(const address_t& to, const identity_t& identity) {
  auto b = builder{make_incoming_prefix(to)};
  b.write(identity);
  return b.data;
}

}  // namespace mandate::schema::key
