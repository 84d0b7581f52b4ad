#pragma once

#include <mandate/registry/delegation_rules.hpp>
#include <mandate/registry/event_sink.hpp>
#include <mandate/schema/delegation_record.hpp>
#include <mandate/schema/delegation_result.hpp>
#include <mandate/schema/encoding/scale/encoder.hpp>
#include <mandate/schema/key/delegation_record.hpp>
#include <mandate/schema/primitives.hpp>
#include <mandate/schema/set_delegation.hpp>
#include <mandate/storage/storage.hpp>
#include <spdlog/spdlog.h>

#include <iterator>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace mandate::registry {

/// Authoritative, idempotent store of delegation records.
///
/// Records live under `DELEGATION|<identity>` and are never physically
/// removed; revocation only clears `enabled`. Currently-enabled identities are
/// additionally indexed under `OUTGOING|<from>` and `INCOMING|<to>` for
/// enumeration. Each mutation commits the record and both index entries as one
/// write batch. Mutations are serialized; reads share the lock.
template <typename Library>
class delegation_store final {
 public:
  using storage_t = mandate::storage::storage<Library>;
  using encoder_t = mandate::schema::encoding::encoder<
      mandate::schema::encoding::scale_encoder_tag>;

  delegation_store(encoder_t& encoder, storage_t& storage)
      : encoder_{encoder}, storage_{storage} {}

  delegation_store(const delegation_store&) = delete;
  delegation_store& operator=(const delegation_store&) = delete;

  /// Grant (`enable = true`) or revoke (`enable = false`) one scope.
  ///
  /// `caller` is the authenticated submitter and must equal `request.from`.
  /// Rejected requests leave the store untouched and emit no event.
  mandate::schema::delegation_result_t set_delegation(
      const mandate::schema::address_t& caller,
      const mandate::schema::set_delegation_t& request) {
    if (auto rejected = validate_set_delegation(caller, request)) {
      return *rejected;
    }
    auto result = mandate::schema::delegation_result_t{};
    {
      auto lock = std::unique_lock{mutex_};
      auto batch = mandate::storage::write_batch{};
      result = apply(request, batch);
      storage_.commit(batch);
    }
    publish(result.events);
    return result;
  }

  mandate::schema::delegation_result_t delegate_all(
      const mandate::schema::address_t& caller,
      const mandate::schema::address_t& to,
      const mandate::schema::rights_t& rights,
      const bool enable) {
    return set_delegation(
        caller,
        mandate::schema::set_delegation_t{
            .type = mandate::schema::delegation_type_t::all,
            .from = caller,
            .to = to,
            .rights = rights,
            .enable = enable});
  }

  mandate::schema::delegation_result_t delegate_contract(
      const mandate::schema::address_t& caller,
      const mandate::schema::address_t& to,
      const mandate::schema::address_t& contract,
      const mandate::schema::rights_t& rights,
      const bool enable) {
    return set_delegation(
        caller,
        mandate::schema::set_delegation_t{
            .type = mandate::schema::delegation_type_t::contract,
            .from = caller,
            .to = to,
            .contract = contract,
            .rights = rights,
            .enable = enable});
  }

  mandate::schema::delegation_result_t delegate_erc721(
      const mandate::schema::address_t& caller,
      const mandate::schema::address_t& to,
      const mandate::schema::address_t& contract,
      const mandate::schema::uint256_t& token_id,
      const mandate::schema::rights_t& rights,
      const bool enable) {
    return set_delegation(
        caller,
        mandate::schema::set_delegation_t{
            .type = mandate::schema::delegation_type_t::erc721,
            .from = caller,
            .to = to,
            .contract = contract,
            .token_id = token_id,
            .rights = rights,
            .enable = enable});
  }

  /// A zero amount revokes.
  mandate::schema::delegation_result_t delegate_erc20(
      const mandate::schema::address_t& caller,
      const mandate::schema::address_t& to,
      const mandate::schema::address_t& contract,
      const mandate::schema::rights_t& rights,
      const mandate::schema::uint256_t& amount) {
    return set_delegation(
        caller,
        mandate::schema::set_delegation_t{
            .type = mandate::schema::delegation_type_t::erc20,
            .from = caller,
            .to = to,
            .contract = contract,
            .rights = rights,
            .amount = amount,
            .enable = amount != 0});
  }

  /// A zero amount revokes.
  mandate::schema::delegation_result_t delegate_erc1155(
      const mandate::schema::address_t& caller,
      const mandate::schema::address_t& to,
      const mandate::schema::address_t& contract,
      const mandate::schema::uint256_t& token_id,
      const mandate::schema::rights_t& rights,
      const mandate::schema::uint256_t& amount) {
    return set_delegation(
        caller,
        mandate::schema::set_delegation_t{
            .type = mandate::schema::delegation_type_t::erc1155,
            .from = caller,
            .to = to,
            .contract = contract,
            .token_id = token_id,
            .rights = rights,
            .amount = amount,
            .enable = amount != 0});
  }

  /// Revoke every currently-enabled outgoing delegation of `caller`.
  std::vector<mandate::schema::identity_t> revoke_all_outgoing(
      const mandate::schema::address_t& caller) {
    auto revoked = std::vector<mandate::schema::identity_t>{};
    auto events = std::vector<mandate::schema::delegation_event_t>{};
    {
      auto lock = std::unique_lock{mutex_};
      auto batch = mandate::storage::write_batch{};
      for (const auto& identity :
           list_index(mandate::schema::key::make_outgoing_prefix(caller))) {
        auto record = read_record_unlocked(identity);
        if (record.type == mandate::schema::delegation_type_t::none ||
            !record.enabled) {
          continue;
        }
        auto request = mandate::schema::set_delegation_t{
            .type = record.type,
            .from = record.from,
            .to = record.to,
            .contract = record.contract,
            .token_id = mandate::schema::from_word(record.token_id),
            .rights = record.rights,
            .amount = mandate::schema::from_word(record.amount),
            .enable = false};
        auto result = apply(request, batch);
        revoked.push_back(result.identity);
        events.insert(std::end(events), std::begin(result.events),
                      std::end(result.events));
      }
      storage_.commit(batch);
    }
    spdlog::info("Revoked {} outgoing delegation(s) of {}", revoked.size(),
                 mandate::schema::to_hex(caller));
    publish(events);
    return revoked;
  }

  /// Every currently-enabled record owned by `from`, in no particular order.
  std::vector<mandate::schema::delegation_record_t> get_outgoing_delegations(
      const mandate::schema::address_t& from) const {
    auto lock = std::shared_lock{mutex_};
    return load_enabled(
        list_index(mandate::schema::key::make_outgoing_prefix(from)));
  }

  /// Every currently-enabled record naming `to` as delegate.
  std::vector<mandate::schema::delegation_record_t> get_incoming_delegations(
      const mandate::schema::address_t& to) const {
    auto lock = std::shared_lock{mutex_};
    return load_enabled(
        list_index(mandate::schema::key::make_incoming_prefix(to)));
  }

  std::vector<mandate::schema::identity_t> get_outgoing_identities(
      const mandate::schema::address_t& from) const {
    auto lock = std::shared_lock{mutex_};
    return list_index(mandate::schema::key::make_outgoing_prefix(from));
  }

  std::vector<mandate::schema::identity_t> get_incoming_identities(
      const mandate::schema::address_t& to) const {
    auto lock = std::shared_lock{mutex_};
    return list_index(mandate::schema::key::make_incoming_prefix(to));
  }

  /// One entry per identity; disabled or unknown identities map to a
  /// `none`-type record.
  std::vector<mandate::schema::delegation_record_t>
  get_delegations_from_identities(
      const std::vector<mandate::schema::identity_t>& identities) const {
    auto lock = std::shared_lock{mutex_};
    auto records = std::vector<mandate::schema::delegation_record_t>{};
    records.reserve(identities.size());
    for (const auto& identity : identities) {
      auto record = read_record_unlocked(identity);
      if (!record.enabled) {
        record = mandate::schema::delegation_record_t{};
      }
      records.push_back(record);
    }
    return records;
  }

  /// Stored record (possibly disabled), or a `none`-type sentinel when the
  /// identity was never stored.
  mandate::schema::delegation_record_t read_record(
      const mandate::schema::identity_t& identity) const {
    auto lock = std::shared_lock{mutex_};
    return read_record_unlocked(identity);
  }

  /// Install the audit collaborator notified after each accepted mutation.
  void set_event_sink(event_sink_t sink) {
    auto lock = std::unique_lock{mutex_};
    event_sink_ = std::move(sink);
  }

 private:
  /// Stage the writes for `request` into `batch`; nothing is persisted until
  /// the caller commits it.
  mandate::schema::delegation_result_t apply(
      const mandate::schema::set_delegation_t& request,
      mandate::storage::write_batch& batch) {
    auto identity = compute_identity(request);
    auto record_key = mandate::schema::key::make_record_key(identity);
    auto outgoing_key =
        mandate::schema::key::make_outgoing_key(request.from, identity);
    auto incoming_key =
        mandate::schema::key::make_incoming_key(request.to, identity);

    auto result = mandate::schema::delegation_result_t{};
    result.identity = identity;
    result.codespace = std::string{kDelegateCodespace};

    if (request.enable) {
      batch.put(encoder_, view(record_key), make_record(request));
      batch.put(encoder_, view(outgoing_key), identity);
      batch.put(encoder_, view(incoming_key), identity);
      result.info = "delegation enabled";
    } else {
      auto existing =
          storage_.template get<mandate::schema::delegation_record_t>(
              encoder_, view(record_key));
      if (existing.has_value()) {
        existing->enabled = false;
        batch.put(encoder_, view(record_key), *existing);
        batch.erase(view(outgoing_key));
        batch.erase(view(incoming_key));
      }
      result.info = "delegation disabled";
    }

    spdlog::debug("{} {} delegation {} -> {} identity {}",
                  request.enable ? "Enabled" : "Disabled",
                  mandate::schema::to_string(request.type),
                  mandate::schema::to_hex(request.from),
                  mandate::schema::to_hex(request.to),
                  mandate::schema::to_hex(identity));
    result.events.push_back(make_delegation_event(request, identity));
    return result;
  }

  void publish(const std::vector<mandate::schema::delegation_event_t>& events) {
    auto sink = event_sink_t{};
    {
      auto lock = std::shared_lock{mutex_};
      sink = event_sink_;
    }
    if (!sink) {
      return;
    }
    for (const auto& event : events) {
      sink(event);
    }
  }

  mandate::schema::delegation_record_t read_record_unlocked(
      const mandate::schema::identity_t& identity) const {
    auto record_key = mandate::schema::key::make_record_key(identity);
    auto record = storage_.template get<mandate::schema::delegation_record_t>(
        encoder_, view(record_key));
    return record.value_or(mandate::schema::delegation_record_t{});
  }

  std::vector<mandate::schema::identity_t> list_index(
      const mandate::schema::bytes_t& prefix) const {
    auto identities = std::vector<mandate::schema::identity_t>{};
    for (const auto& [key, value] : storage_.list_by_prefix(view(prefix))) {
      identities.push_back(encoder_.template decode<mandate::schema::identity_t>(
          mandate::schema::bytes_view_t{value.data(), value.size()}));
    }
    return identities;
  }

  std::vector<mandate::schema::delegation_record_t> load_enabled(
      const std::vector<mandate::schema::identity_t>& identities) const {
    auto records = std::vector<mandate::schema::delegation_record_t>{};
    records.reserve(identities.size());
    for (const auto& identity : identities) {
      auto record = read_record_unlocked(identity);
      if (record.type != mandate::schema::delegation_type_t::none &&
          record.enabled) {
        records.push_back(record);
      }
    }
    return records;
  }

  static mandate::schema::bytes_view_t view(
      const mandate::schema::bytes_t& bytes) {
    return mandate::schema::bytes_view_t{bytes.data(), bytes.size()};
  }

  mutable std::shared_mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  event_sink_t event_sink_;
};

}  // namespace mandate::registry
