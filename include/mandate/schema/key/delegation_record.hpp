#pragma once
#include <mandate/schema/delegation_record.hpp>
#include <mandate/schema/delegation_type.hpp>
#include <mandate/schema/primitives.hpp>
#include <string_view>

// Schema key type: delegation record.
// Registry keyspace: identity derivation plus the record and enumeration
// index keys.
namespace mandate::schema::key {

inline constexpr auto kIdentityDomain =
    std::string_view{"mandate.delegation.v1|"};
inline constexpr auto kDelegationPrefix = std::string_view{"DELEGATION|"};
inline constexpr auto kOutgoingPrefix = std::string_view{"OUTGOING|"};
inline constexpr auto kIncomingPrefix = std::string_view{"INCOMING|"};

/// Identity of a delegation scope. Binds exactly
/// (type, from, to, contract, token_id, rights); `enabled` and `amount` are
/// not part of it.
identity_t make_identity(delegation_type_t type,
                         const address_t& from,
                         const address_t& to,
                         const address_t& contract,
                         const word_t& token_id,
                         const rights_t& rights);

identity_t make_identity(const delegation_record_t& record);

bytes_t make_record_key(const identity_t& identity);

bytes_t make_outgoing_key(const address_t& from, const identity_t& identity);
bytes_t make_outgoing_prefix(const address_t& from);

bytes_t make_incoming_key(const address_t& to, const identity_t& identity);
bytes_t make_incoming_prefix(const address_t& to);

}  // namespace mandate::schema::key
