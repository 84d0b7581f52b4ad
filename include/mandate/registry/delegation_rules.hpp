#pragma once

#include <mandate/schema/delegation_event.hpp>
#include <mandate/schema/delegation_record.hpp>
#include <mandate/schema/delegation_result.hpp>
#include <mandate/schema/primitives.hpp>
#include <mandate/schema/set_delegation.hpp>
#include <optional>
#include <string_view>

namespace mandate::registry {

inline constexpr auto kDelegateCodespace = std::string_view{"mandate.delegate"};
inline constexpr auto kDelegationChangedEvent =
    std::string_view{"delegation_changed"};

/// Reject a set_delegation request before any state is touched.
///
/// Returns the populated failure result, or std::nullopt when `caller` may
/// apply `request`.
std::optional<mandate::schema::delegation_result_t> validate_set_delegation(
    const mandate::schema::address_t& caller,
    const mandate::schema::set_delegation_t& request);

mandate::schema::identity_t compute_identity(
    const mandate::schema::set_delegation_t& request);

mandate::schema::delegation_record_t make_record(
    const mandate::schema::set_delegation_t& request);

mandate::schema::delegation_event_t make_delegation_event(
    const mandate::schema::set_delegation_t& request,
    const mandate::schema::identity_t& identity);

/// A record with zero rights satisfies any query; otherwise rights must match
/// exactly.
bool rights_satisfy(const mandate::schema::rights_t& record_rights,
                    const mandate::schema::rights_t& query_rights);

}  // namespace mandate::registry
