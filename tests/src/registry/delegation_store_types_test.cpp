#include <gtest/gtest.h>
#include <mandate/registry/delegation_rules.hpp>
#include <mandate/schema/delegation_error_code.hpp>
#include <mandate/schema/key/delegation_record.hpp>
#include <mandate/testing/registry_fixture.hpp>

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>

namespace {

const auto kVault = mandate::testing::make_address(1);
const auto kDelegate = mandate::testing::make_address(2);
const auto kOtherDelegate = mandate::testing::make_address(3);
const auto kCollection = mandate::testing::make_address(10);
const auto kToken = mandate::testing::make_address(11);

mandate::schema::set_delegation_t make_erc721_request(
    const mandate::schema::uint256_t& token_id,
    const bool enable) {
  return mandate::schema::set_delegation_t{
      .type = mandate::schema::delegation_type_t::erc721,
      .from = kVault,
      .to = kDelegate,
      .contract = kCollection,
      .token_id = token_id,
      .enable = enable};
}

uint32_t code_of(const mandate::schema::delegation_error_code code) {
  return static_cast<uint32_t>(code);
}

std::optional<std::string> attribute(
    const mandate::schema::delegation_event_t& event,
    const std::string_view key) {
  for (const auto& item : event.attributes) {
    if (item.key == key) {
      return item.value;
    }
  }
  return std::nullopt;
}

bool contains(const std::vector<mandate::schema::identity_t>& identities,
              const mandate::schema::identity_t& identity) {
  return std::find(std::begin(identities), std::end(identities), identity) !=
         std::end(identities);
}

}  // namespace

TEST(delegation_store_types, grant_stores_enabled_record) {
  auto fixture = mandate::testing::registry_fixture{};
  auto result =
      fixture.store().set_delegation(kVault, make_erc721_request(7, true));
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(result.codespace, "mandate.delegate");

  auto record = fixture.store().read_record(result.identity);
  EXPECT_EQ(record.type, mandate::schema::delegation_type_t::erc721);
  EXPECT_EQ(record.from, kVault);
  EXPECT_EQ(record.to, kDelegate);
  EXPECT_EQ(record.contract, kCollection);
  EXPECT_EQ(mandate::schema::from_word(record.token_id), 7);
  EXPECT_TRUE(record.enabled);
  EXPECT_EQ(mandate::schema::key::make_identity(record), result.identity);
}

TEST(delegation_store_types, repeated_grant_is_idempotent) {
  auto fixture = mandate::testing::registry_fixture{};
  auto first =
      fixture.store().set_delegation(kVault, make_erc721_request(7, true));
  auto entries_after_first = fixture.storage().entries;
  auto second =
      fixture.store().set_delegation(kVault, make_erc721_request(7, true));

  EXPECT_EQ(first.identity, second.identity);
  EXPECT_EQ(fixture.storage().entries, entries_after_first);
  EXPECT_EQ(fixture.store().get_outgoing_delegations(kVault).size(), 1u);
}

TEST(delegation_store_types, revoke_disables_without_deleting) {
  auto fixture = mandate::testing::registry_fixture{};
  auto granted =
      fixture.store().set_delegation(kVault, make_erc721_request(7, true));
  auto revoked =
      fixture.store().set_delegation(kVault, make_erc721_request(7, false));
  ASSERT_EQ(revoked.code, 0u);
  EXPECT_EQ(revoked.identity, granted.identity);

  auto record = fixture.store().read_record(granted.identity);
  EXPECT_EQ(record.type, mandate::schema::delegation_type_t::erc721);
  EXPECT_FALSE(record.enabled);
  EXPECT_TRUE(fixture.store().get_outgoing_delegations(kVault).empty());
  EXPECT_TRUE(fixture.store().get_incoming_delegations(kDelegate).empty());
  EXPECT_TRUE(fixture.store().get_outgoing_identities(kVault).empty());
}

TEST(delegation_store_types, revoke_then_regrant_reuses_identity) {
  auto fixture = mandate::testing::registry_fixture{};
  auto granted =
      fixture.store().set_delegation(kVault, make_erc721_request(7, true));
  fixture.store().set_delegation(kVault, make_erc721_request(7, false));
  auto regranted =
      fixture.store().set_delegation(kVault, make_erc721_request(7, true));

  EXPECT_EQ(regranted.identity, granted.identity);
  EXPECT_TRUE(fixture.store().read_record(granted.identity).enabled);
  EXPECT_EQ(fixture.store().get_outgoing_identities(kVault).size(), 1u);
}

TEST(delegation_store_types, revoke_of_unknown_scope_writes_nothing) {
  auto fixture = mandate::testing::registry_fixture{};
  auto result =
      fixture.store().set_delegation(kVault, make_erc721_request(9, false));
  ASSERT_EQ(result.code, 0u);
  EXPECT_TRUE(fixture.storage().entries.empty());
  EXPECT_EQ(fixture.store().read_record(result.identity).type,
            mandate::schema::delegation_type_t::none);
  EXPECT_EQ(fixture.events().size(), 1u);
}

TEST(delegation_store_types, revoke_retains_amount) {
  auto fixture = mandate::testing::registry_fixture{};
  auto granted = fixture.store().delegate_erc20(
      kVault, kDelegate, kToken, mandate::schema::make_zero_hash(), 250);
  ASSERT_EQ(granted.code, 0u);

  auto request = mandate::schema::set_delegation_t{
      .type = mandate::schema::delegation_type_t::erc20,
      .from = kVault,
      .to = kDelegate,
      .contract = kToken,
      .amount = 250,
      .enable = false};
  ASSERT_EQ(fixture.store().set_delegation(kVault, request).code, 0u);

  auto record = fixture.store().read_record(granted.identity);
  EXPECT_FALSE(record.enabled);
  EXPECT_EQ(mandate::schema::from_word(record.amount), 250);
}

TEST(delegation_store_types, self_delegation_is_rejected_without_mutation) {
  auto fixture = mandate::testing::registry_fixture{};
  auto request = make_erc721_request(7, true);
  request.to = kVault;

  auto result = fixture.store().set_delegation(kVault, request);
  EXPECT_EQ(result.code,
            code_of(mandate::schema::delegation_error_code::self_delegation));
  EXPECT_EQ(result.codespace, "mandate.delegate");
  EXPECT_TRUE(result.events.empty());
  EXPECT_TRUE(fixture.storage().entries.empty());
  EXPECT_TRUE(fixture.events().empty());
  EXPECT_TRUE(fixture.store().get_outgoing_delegations(kVault).empty());
}

TEST(delegation_store_types, unauthorized_caller_is_rejected) {
  auto fixture = mandate::testing::registry_fixture{};
  auto result = fixture.store().set_delegation(kOtherDelegate,
                                               make_erc721_request(7, true));
  EXPECT_EQ(result.code,
            code_of(mandate::schema::delegation_error_code::unauthorized));
  EXPECT_TRUE(fixture.storage().entries.empty());
  EXPECT_TRUE(fixture.events().empty());
}

TEST(delegation_store_types, none_type_is_rejected) {
  auto fixture = mandate::testing::registry_fixture{};
  auto request = make_erc721_request(7, true);
  request.type = mandate::schema::delegation_type_t::none;

  auto result = fixture.store().set_delegation(kVault, request);
  EXPECT_EQ(result.code,
            code_of(
                mandate::schema::delegation_error_code::invalid_delegation_type));
  EXPECT_TRUE(fixture.storage().entries.empty());
}

TEST(delegation_store_types, scope_shape_is_validated) {
  auto fixture = mandate::testing::registry_fixture{};
  auto invalid_scope =
      code_of(mandate::schema::delegation_error_code::invalid_scope);

  auto wallet_with_contract = mandate::schema::set_delegation_t{
      .type = mandate::schema::delegation_type_t::all,
      .from = kVault,
      .to = kDelegate,
      .contract = kCollection,
      .enable = true};
  EXPECT_EQ(fixture.store().set_delegation(kVault, wallet_with_contract).code,
            invalid_scope);

  auto contract_without_address = mandate::schema::set_delegation_t{
      .type = mandate::schema::delegation_type_t::contract,
      .from = kVault,
      .to = kDelegate,
      .enable = true};
  EXPECT_EQ(
      fixture.store().set_delegation(kVault, contract_without_address).code,
      invalid_scope);

  auto contract_with_token = contract_without_address;
  contract_with_token.contract = kCollection;
  contract_with_token.token_id = 1;
  EXPECT_EQ(fixture.store().set_delegation(kVault, contract_with_token).code,
            invalid_scope);

  auto erc721_with_amount = make_erc721_request(7, true);
  erc721_with_amount.amount = 1;
  EXPECT_EQ(fixture.store().set_delegation(kVault, erc721_with_amount).code,
            invalid_scope);

  auto erc20_with_token = mandate::schema::set_delegation_t{
      .type = mandate::schema::delegation_type_t::erc20,
      .from = kVault,
      .to = kDelegate,
      .contract = kToken,
      .token_id = 3,
      .amount = 10,
      .enable = true};
  EXPECT_EQ(fixture.store().set_delegation(kVault, erc20_with_token).code,
            invalid_scope);

  EXPECT_TRUE(fixture.storage().entries.empty());
  EXPECT_TRUE(fixture.events().empty());
}

TEST(delegation_store_types, token_id_zero_is_a_valid_token) {
  auto fixture = mandate::testing::registry_fixture{};
  auto result =
      fixture.store().set_delegation(kVault, make_erc721_request(0, true));
  EXPECT_EQ(result.code, 0u);
  EXPECT_TRUE(fixture.store().read_record(result.identity).enabled);
}

TEST(delegation_store_types, enumeration_tracks_enabled_records) {
  auto fixture = mandate::testing::registry_fixture{};
  auto rights = mandate::testing::make_hash(50);
  auto wallet = fixture.store().delegate_all(kVault, kDelegate,
                                             mandate::schema::make_zero_hash(),
                                             true);
  auto contract = fixture.store().delegate_contract(kVault, kOtherDelegate,
                                                    kCollection, rights, true);
  auto token = fixture.store().delegate_erc721(
      kVault, kDelegate, kCollection, 7, mandate::schema::make_zero_hash(),
      true);
  fixture.store().delegate_erc721(kVault, kDelegate, kCollection, 7,
                                  mandate::schema::make_zero_hash(), false);

  auto outgoing = fixture.store().get_outgoing_identities(kVault);
  EXPECT_EQ(outgoing.size(), 2u);
  EXPECT_TRUE(contains(outgoing, wallet.identity));
  EXPECT_TRUE(contains(outgoing, contract.identity));
  EXPECT_FALSE(contains(outgoing, token.identity));

  auto outgoing_records = fixture.store().get_outgoing_delegations(kVault);
  ASSERT_EQ(outgoing_records.size(), 2u);
  for (const auto& record : outgoing_records) {
    EXPECT_TRUE(record.enabled);
    EXPECT_EQ(record.from, kVault);
  }

  auto incoming = fixture.store().get_incoming_delegations(kDelegate);
  ASSERT_EQ(incoming.size(), 1u);
  EXPECT_EQ(incoming[0].type, mandate::schema::delegation_type_t::all);

  auto incoming_other = fixture.store().get_incoming_identities(kOtherDelegate);
  ASSERT_EQ(incoming_other.size(), 1u);
  EXPECT_EQ(incoming_other[0], contract.identity);
  EXPECT_EQ(fixture.store().read_record(contract.identity).rights, rights);

  EXPECT_TRUE(fixture.store().get_outgoing_delegations(kDelegate).empty());
}

TEST(delegation_store_types, delegations_from_identities_hides_disabled) {
  auto fixture = mandate::testing::registry_fixture{};
  auto enabled =
      fixture.store().set_delegation(kVault, make_erc721_request(1, true));
  auto disabled =
      fixture.store().set_delegation(kVault, make_erc721_request(2, true));
  fixture.store().set_delegation(kVault, make_erc721_request(2, false));
  auto unknown = mandate::testing::make_hash(77);

  auto records = fixture.store().get_delegations_from_identities(
      {enabled.identity, disabled.identity, unknown});
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records[0].type, mandate::schema::delegation_type_t::erc721);
  EXPECT_EQ(mandate::schema::from_word(records[0].token_id), 1);
  EXPECT_EQ(records[1], mandate::schema::delegation_record_t{});
  EXPECT_EQ(records[2], mandate::schema::delegation_record_t{});
}

TEST(delegation_store_types, revoke_all_outgoing_clears_every_grant) {
  auto fixture = mandate::testing::registry_fixture{};
  fixture.store().delegate_all(kVault, kDelegate,
                               mandate::schema::make_zero_hash(), true);
  fixture.store().delegate_contract(kVault, kOtherDelegate, kCollection,
                                    mandate::schema::make_zero_hash(), true);
  fixture.store().delegate_erc1155(kVault, kDelegate, kCollection, 4,
                                   mandate::schema::make_zero_hash(), 20);
  auto unrelated = fixture.store().delegate_all(
      kOtherDelegate, kDelegate, mandate::schema::make_zero_hash(), true);
  auto events_before = fixture.events().size();

  auto revoked = fixture.store().revoke_all_outgoing(kVault);
  EXPECT_EQ(revoked.size(), 3u);
  EXPECT_EQ(fixture.events().size(), events_before + 3);
  for (const auto& identity : revoked) {
    EXPECT_FALSE(fixture.store().read_record(identity).enabled);
  }
  EXPECT_TRUE(fixture.store().get_outgoing_delegations(kVault).empty());
  EXPECT_TRUE(fixture.store().get_incoming_identities(kOtherDelegate).empty());

  auto incoming = fixture.store().get_incoming_identities(kDelegate);
  ASSERT_EQ(incoming.size(), 1u);
  EXPECT_EQ(incoming[0], unrelated.identity);

  EXPECT_TRUE(fixture.store().revoke_all_outgoing(kVault).empty());
}

TEST(delegation_store_types, accepted_calls_publish_delegation_changed) {
  auto fixture = mandate::testing::registry_fixture{};
  auto result =
      fixture.store().set_delegation(kVault, make_erc721_request(7, true));

  ASSERT_EQ(result.events.size(), 1u);
  ASSERT_EQ(fixture.events().size(), 1u);
  const auto& event = fixture.events()[0];
  EXPECT_EQ(event.type, "delegation_changed");
  EXPECT_EQ(attribute(event, "type"), "erc721");
  EXPECT_EQ(attribute(event, "from"), "0x" + mandate::schema::to_hex(kVault));
  EXPECT_EQ(attribute(event, "to"), "0x" + mandate::schema::to_hex(kDelegate));
  EXPECT_EQ(attribute(event, "token_id"), "7");
  EXPECT_EQ(attribute(event, "amount"), "0");
  EXPECT_EQ(attribute(event, "enable"), "true");
  EXPECT_EQ(attribute(event, "identity"),
            "0x" + mandate::schema::to_hex(result.identity));
}

TEST(delegation_store_types, zero_amount_fungible_grant_revokes) {
  auto fixture = mandate::testing::registry_fixture{};
  auto granted = fixture.store().delegate_erc1155(
      kVault, kDelegate, kCollection, 4, mandate::schema::make_zero_hash(), 20);
  ASSERT_EQ(granted.code, 0u);
  auto revoked = fixture.store().delegate_erc1155(
      kVault, kDelegate, kCollection, 4, mandate::schema::make_zero_hash(), 0);

  EXPECT_EQ(revoked.identity, granted.identity);
  EXPECT_FALSE(fixture.store().read_record(granted.identity).enabled);
  EXPECT_EQ(attribute(fixture.events().back(), "enable"), "false");
}

TEST(delegation_store_types, compute_identity_matches_stored_identity) {
  auto fixture = mandate::testing::registry_fixture{};
  auto request = make_erc721_request(7, true);
  auto result = fixture.store().set_delegation(kVault, request);
  EXPECT_EQ(mandate::registry::compute_identity(request), result.identity);

  request.enable = false;
  EXPECT_EQ(mandate::registry::compute_identity(request), result.identity);
}

TEST(delegation_store_types, grant_and_revoke_write_record_with_indices) {
  auto fixture = mandate::testing::registry_fixture{};
  fixture.store().set_delegation(kVault, make_erc721_request(7, true));
  EXPECT_EQ(fixture.storage().entries.size(), 3u);

  fixture.store().set_delegation(kVault, make_erc721_request(7, false));
  EXPECT_EQ(fixture.storage().entries.size(), 1u);

  fixture.store().set_delegation(kVault, make_erc721_request(7, true));
  fixture.store().set_delegation(kVault, make_erc721_request(8, true));
  EXPECT_EQ(fixture.storage().entries.size(), 6u);

  fixture.store().revoke_all_outgoing(kVault);
  EXPECT_EQ(fixture.storage().entries.size(), 2u);
}

TEST(delegation_store_types, zero_record_rights_satisfy_any_query) {
  const auto zero = mandate::schema::make_zero_hash();
  const auto rights = mandate::testing::make_hash(100);
  const auto other = mandate::testing::make_hash(200);

  EXPECT_TRUE(mandate::registry::rights_satisfy(zero, zero));
  EXPECT_TRUE(mandate::registry::rights_satisfy(zero, rights));
  EXPECT_TRUE(mandate::registry::rights_satisfy(rights, rights));
  EXPECT_FALSE(mandate::registry::rights_satisfy(rights, zero));
  EXPECT_FALSE(mandate::registry::rights_satisfy(rights, other));
}
