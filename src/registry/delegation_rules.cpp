#include <mandate/registry/delegation_rules.hpp>
#include <mandate/schema/delegation_error_code.hpp>
#include <mandate/schema/key/delegation_record.hpp>
#include <spdlog/spdlog.h>

#include <string>
#include <utility>

using namespace mandate::schema;

namespace {

delegation_result_t make_error_result(const delegation_error_code code,
                                      std::string log,
                                      std::string info) {
  auto result = delegation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{mandate::registry::kDelegateCodespace};
  return result;
}

std::optional<std::string> scope_violation(const set_delegation_t& request) {
  const auto has_contract = !is_zero(request.contract);
  const auto has_token_id = request.token_id != 0;
  const auto has_amount = request.amount != 0;
  switch (request.type) {
    case delegation_type_t::all:
      if (has_contract) {
        return "wallet delegation must not name a contract";
      }
      if (has_token_id) {
        return "wallet delegation must not name a token id";
      }
      if (has_amount) {
        return "wallet delegation must not carry an amount";
      }
      return std::nullopt;
    case delegation_type_t::contract:
      if (!has_contract) {
        return "contract delegation requires a contract";
      }
      if (has_token_id) {
        return "contract delegation must not name a token id";
      }
      if (has_amount) {
        return "contract delegation must not carry an amount";
      }
      return std::nullopt;
    case delegation_type_t::erc721:
      if (!has_contract) {
        return "erc721 delegation requires a contract";
      }
      if (has_amount) {
        return "erc721 delegation must not carry an amount";
      }
      return std::nullopt;
    case delegation_type_t::erc20:
      if (!has_contract) {
        return "erc20 delegation requires a contract";
      }
      if (has_token_id) {
        return "erc20 delegation must not name a token id";
      }
      return std::nullopt;
    case delegation_type_t::erc1155:
      if (!has_contract) {
        return "erc1155 delegation requires a contract";
      }
      return std::nullopt;
    case delegation_type_t::none:
      break;
  }
  return "unknown delegation type";
}

delegation_event_attribute_t make_attribute(std::string key,
                                            std::string value,
                                            const bool index = false) {
  return delegation_event_attribute_t{
      .version = 1, .key = std::move(key), .value = std::move(value),
      .index = index};
}

}  // namespace

namespace mandate::registry {

std::optional<delegation_result_t> validate_set_delegation(
    const address_t& caller,
    const set_delegation_t& request) {
  if (caller != request.from) {
    spdlog::warn("Rejecting delegation from {} submitted by {}",
                 to_hex(request.from), to_hex(caller));
    return make_error_result(delegation_error_code::unauthorized,
                             "unauthorized",
                             "caller is not the delegating vault");
  }
  if (request.type == delegation_type_t::none) {
    spdlog::warn("Rejecting delegation with type none from {}",
                 to_hex(request.from));
    return make_error_result(delegation_error_code::invalid_delegation_type,
                             "invalid delegation type",
                             "type none cannot be stored");
  }
  if (request.to == request.from) {
    spdlog::warn("Rejecting self delegation for {}", to_hex(request.from));
    return make_error_result(delegation_error_code::self_delegation,
                             "self delegation",
                             "delegate must differ from vault");
  }
  if (auto violation = scope_violation(request)) {
    spdlog::warn("Rejecting {} delegation from {}: {}",
                 to_string(request.type), to_hex(request.from), *violation);
    return make_error_result(delegation_error_code::invalid_scope,
                             "invalid delegation scope", *violation);
  }
  return std::nullopt;
}

identity_t compute_identity(const set_delegation_t& request) {
  return key::make_identity(request.type, request.from, request.to,
                            request.contract, to_word(request.token_id),
                            request.rights);
}

delegation_record_t make_record(const set_delegation_t& request) {
  return delegation_record_t{.version = 1,
                             .type = request.type,
                             .from = request.from,
                             .to = request.to,
                             .contract = request.contract,
                             .token_id = to_word(request.token_id),
                             .rights = request.rights,
                             .amount = to_word(request.amount),
                             .enabled = request.enable};
}

delegation_event_t make_delegation_event(const set_delegation_t& request,
                                         const identity_t& identity) {
  auto event = delegation_event_t{};
  event.type = std::string{kDelegationChangedEvent};
  event.attributes = {
      make_attribute("type", std::string{to_string(request.type)}),
      make_attribute("from", "0x" + to_hex(request.from), true),
      make_attribute("to", "0x" + to_hex(request.to), true),
      make_attribute("contract", "0x" + to_hex(request.contract), true),
      make_attribute("token_id", request.token_id.str()),
      make_attribute("rights", "0x" + to_hex(request.rights)),
      make_attribute("amount", request.amount.str()),
      make_attribute("enable", request.enable ? "true" : "false"),
      make_attribute("identity", "0x" + to_hex(identity), true)};
  return event;
}

bool rights_satisfy(const rights_t& record_rights,
                    const rights_t& query_rights) {
  return is_zero(record_rights) || record_rights == query_rights;
}

}  // namespace mandate::registry
