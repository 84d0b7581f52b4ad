#pragma once

#include <mandate/registry/delegation_rules.hpp>
#include <mandate/registry/delegation_store.hpp>
#include <mandate/schema/delegation_record.hpp>
#include <mandate/schema/delegation_type.hpp>
#include <mandate/schema/key/delegation_record.hpp>
#include <mandate/schema/primitives.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <optional>
#include <span>

namespace mandate::registry {

/// One granularity level walked during resolution.
struct resolution_level final {
  mandate::schema::delegation_type_t type{};
  bool contract_scoped{};
  bool token_scoped{};
};

/// ERC721 priority list: token, then contract, then wallet.
inline constexpr auto kTokenResolutionLevels = std::array{
    resolution_level{mandate::schema::delegation_type_t::erc721, true, true},
    resolution_level{mandate::schema::delegation_type_t::contract, true, false},
    resolution_level{mandate::schema::delegation_type_t::all, false, false}};

inline constexpr auto kContractResolutionLevels = std::array{
    resolution_level{mandate::schema::delegation_type_t::contract, true, false},
    resolution_level{mandate::schema::delegation_type_t::all, false, false}};

inline constexpr auto kWalletResolutionLevels = std::array{
    resolution_level{mandate::schema::delegation_type_t::all, false, false}};

/// Answers "may `to` act for `from`" over a delegation_store.
///
/// Levels are a union: any enabled match authorizes, and revoking one level
/// never masks another. Lookups never fail; a miss is a plain `false`.
template <typename Library>
class authorization_resolver final {
 public:
  explicit authorization_resolver(const delegation_store<Library>& store)
      : store_{store} {}

  /// Token-level query for ERC721 assets.
  bool check(const mandate::schema::address_t& to,
             const mandate::schema::address_t& from,
             const mandate::schema::address_t& contract,
             const mandate::schema::uint256_t& token_id,
             const mandate::schema::rights_t& rights) const {
    return resolve(kTokenResolutionLevels, to, from, contract, token_id, rights)
        .has_value();
  }

  bool check_delegate_for_all(const mandate::schema::address_t& to,
                              const mandate::schema::address_t& from,
                              const mandate::schema::rights_t& rights) const {
    return resolve(kWalletResolutionLevels, to, from, {}, 0, rights)
        .has_value();
  }

  bool check_delegate_for_contract(
      const mandate::schema::address_t& to,
      const mandate::schema::address_t& from,
      const mandate::schema::address_t& contract,
      const mandate::schema::rights_t& rights) const {
    return resolve(kContractResolutionLevels, to, from, contract, 0, rights)
        .has_value();
  }

  bool check_delegate_for_erc721(
      const mandate::schema::address_t& to,
      const mandate::schema::address_t& from,
      const mandate::schema::address_t& contract,
      const mandate::schema::uint256_t& token_id,
      const mandate::schema::rights_t& rights) const {
    return check(to, from, contract, token_id, rights);
  }

  /// Delegated ERC20 amount: unbounded under a wallet or contract grant,
  /// otherwise the larger of the matching erc20 records, else zero.
  mandate::schema::uint256_t check_delegate_for_erc20(
      const mandate::schema::address_t& to,
      const mandate::schema::address_t& from,
      const mandate::schema::address_t& contract,
      const mandate::schema::rights_t& rights) const {
    return resolve_amount(mandate::schema::delegation_type_t::erc20, to, from,
                          contract, 0, rights);
  }

  /// Delegated ERC1155 balance for `(contract, token_id)`, same rules as
  /// check_delegate_for_erc20.
  mandate::schema::uint256_t check_delegate_for_erc1155(
      const mandate::schema::address_t& to,
      const mandate::schema::address_t& from,
      const mandate::schema::address_t& contract,
      const mandate::schema::uint256_t& token_id,
      const mandate::schema::rights_t& rights) const {
    return resolve_amount(mandate::schema::delegation_type_t::erc1155, to,
                          from, contract, token_id, rights);
  }

 private:
  /// First enabled record matching any level, exact rights before zero
  /// rights at each level.
  std::optional<mandate::schema::delegation_record_t> resolve(
      std::span<const resolution_level> levels,
      const mandate::schema::address_t& to,
      const mandate::schema::address_t& from,
      const mandate::schema::address_t& contract,
      const mandate::schema::uint256_t& token_id,
      const mandate::schema::rights_t& rights) const {
    const auto token_word = mandate::schema::to_word(token_id);
    for (const auto& level : levels) {
      const auto scoped_contract =
          level.contract_scoped ? contract : mandate::schema::address_t{};
      const auto scoped_token =
          level.token_scoped ? token_word : mandate::schema::word_t{};
      if (auto found = lookup(level.type, to, from, scoped_contract,
                              scoped_token, rights)) {
        return found;
      }
      if (!mandate::schema::is_zero(rights)) {
        if (auto found = lookup(level.type, to, from, scoped_contract,
                                scoped_token, mandate::schema::rights_t{})) {
          return found;
        }
      }
    }
    return std::nullopt;
  }

  /// Largest amount among the exact-rights and zero-rights balance records;
  /// both authorize the query, so neither overrides the other.
  mandate::schema::uint256_t resolve_amount(
      const mandate::schema::delegation_type_t type,
      const mandate::schema::address_t& to,
      const mandate::schema::address_t& from,
      const mandate::schema::address_t& contract,
      const mandate::schema::uint256_t& token_id,
      const mandate::schema::rights_t& rights) const {
    if (resolve(kContractResolutionLevels, to, from, contract, 0, rights)) {
      return mandate::schema::max_uint256();
    }
    const auto token_word = mandate::schema::to_word(token_id);
    auto amount = mandate::schema::uint256_t{};
    if (auto exact = lookup(type, to, from, contract, token_word, rights)) {
      amount = mandate::schema::from_word(exact->amount);
    }
    if (!mandate::schema::is_zero(rights)) {
      if (auto any = lookup(type, to, from, contract, token_word,
                            mandate::schema::rights_t{})) {
        amount = std::max(amount, mandate::schema::from_word(any->amount));
      }
    }
    return amount;
  }

  std::optional<mandate::schema::delegation_record_t> lookup(
      const mandate::schema::delegation_type_t type,
      const mandate::schema::address_t& to,
      const mandate::schema::address_t& from,
      const mandate::schema::address_t& contract,
      const mandate::schema::word_t& token_id,
      const mandate::schema::rights_t& rights) const {
    auto identity = mandate::schema::key::make_identity(type, from, to,
                                                        contract, token_id,
                                                        rights);
    auto record = store_.read_record(identity);
    if (record.type == mandate::schema::delegation_type_t::none ||
        !record.enabled || !rights_satisfy(record.rights, rights)) {
      return std::nullopt;
    }
    spdlog::trace("Delegation {} matched {} lookup",
                  mandate::schema::to_hex(identity),
                  mandate::schema::to_string(type));
    return record;
  }

  const delegation_store<Library>& store_;
};

}  // namespace mandate::registry
