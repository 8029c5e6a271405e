#pragma once

#include <strongbox/execution/asset_metadata.hpp>
#include <strongbox/execution/asset_registry.hpp>
#include <strongbox/execution/capacity_guard.hpp>
#include <strongbox/execution/config.hpp>
#include <strongbox/execution/external_transfer.hpp>
#include <strongbox/execution/ledger_store.hpp>
#include <strongbox/execution/permission_gate.hpp>
#include <strongbox/execution/price_oracle.hpp>
#include <strongbox/execution/state.hpp>
#include <strongbox/execution/valuation_engine.hpp>
#include <strongbox/schema/app_info.hpp>
#include <strongbox/schema/committed_state.hpp>
#include <strongbox/schema/history_entry.hpp>
#include <strongbox/schema/limits.hpp>
#include <strongbox/schema/operation_counters.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/query_result.hpp>
#include <strongbox/schema/transaction.hpp>
#include <strongbox/schema/transaction_error_code.hpp>
#include <strongbox/schema/transaction_event.hpp>
#include <strongbox/schema/transaction_result.hpp>
#include <strongbox/schema/valuation.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace strongbox::execution {

/// Receives notification records once the operation that produced them is
/// durably committed.
using event_sink_t =
    std::function<void(const strongbox::schema::transaction_event_t&)>;

/// Custodial ledger state machine.
///
/// Every operation runs inside its own state frame: checks first, then the
/// ledger mutation, then the external transfer. A rejection at any step
/// discards the frame, so a failed operation leaves no trace beyond its
/// history row. An exception thrown by a collaborator unwinds the frames and
/// propagates without a history row. The engine takes no lock; callers serialize, and the only
/// re-entry expected is from `external_transfer` callbacks.
class engine final {
 public:
  /// Open the engine over `storage`, seeding roles and limits from `config`
  /// the first time the database is used.
  engine(strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
             storage,
         const engine_config& config,
         const price_oracle& oracle,
         const asset_metadata& metadata,
         external_transfer& transfer);

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Decode and version-check raw transaction bytes without executing them.
  strongbox::schema::transaction_result_t check_transaction(
      const strongbox::schema::bytes_view_t& raw_tx) const;

  /// Decode and execute raw transaction bytes.
  strongbox::schema::transaction_result_t execute(
      const strongbox::schema::bytes_view_t& raw_tx);

  /// Execute a transaction.
  strongbox::schema::transaction_result_t execute(
      const strongbox::schema::transaction_t& tx);

  strongbox::schema::transaction_result_t deposit(
      const strongbox::schema::principal_id_t& signer,
      const strongbox::schema::asset_id_t& asset_id,
      const strongbox::schema::amount_t& amount);

  strongbox::schema::transaction_result_t withdraw(
      const strongbox::schema::principal_id_t& signer,
      const strongbox::schema::asset_id_t& asset_id,
      const strongbox::schema::amount_t& amount);

  strongbox::schema::transaction_result_t register_asset(
      const strongbox::schema::principal_id_t& signer,
      const strongbox::schema::asset_id_t& asset_id,
      const strongbox::schema::price_source_id_t& price_source_id);

  strongbox::schema::transaction_result_t set_capacity_limit(
      const strongbox::schema::principal_id_t& signer,
      const strongbox::schema::value_t& limit);

  strongbox::schema::transaction_result_t set_withdraw_limit(
      const strongbox::schema::principal_id_t& signer,
      const strongbox::schema::amount_t& limit);

  strongbox::schema::transaction_result_t upsert_role_assignment(
      const strongbox::schema::principal_id_t& signer,
      const strongbox::schema::upsert_role_assignment_t& assignment);

  /// Value arriving outside `deposit`. Always rejected.
  strongbox::schema::transaction_result_t receive_direct_transfer(
      const strongbox::schema::principal_id_t& sender,
      const strongbox::schema::asset_id_t& asset_id,
      const strongbox::schema::amount_t& amount);

  strongbox::schema::amount_t balance_of(
      const strongbox::schema::principal_id_t& principal,
      const strongbox::schema::asset_id_t& asset_id) const;
  strongbox::schema::amount_t held(
      const strongbox::schema::asset_id_t& asset_id) const;
  strongbox::schema::operation_counters_t counters_of(
      const strongbox::schema::principal_id_t& principal) const;
  strongbox::schema::limits_t limits() const;
  strongbox::schema::value_t capacity_limit() const;
  strongbox::schema::amount_t withdraw_limit() const;
  strongbox::schema::registered_assets_t registered_assets() const;
  std::optional<strongbox::schema::price_source_id_t> price_source_of(
      const strongbox::schema::asset_id_t& asset_id) const;
  strongbox::schema::valuation_t value_of(
      const strongbox::schema::asset_id_t& asset_id,
      const strongbox::schema::amount_t& amount) const;
  strongbox::schema::valuation_t total_value() const;
  bool has_role(const strongbox::schema::principal_id_t& principal,
                strongbox::schema::role_id_t role) const;

  /// Return application metadata (last sequence and state_root).
  strongbox::schema::app_info_t info() const;

  /// Return history entries in the inclusive sequence range, read from
  /// committed storage. Rows staged by an operation still in progress are not
  /// visible.
  std::vector<strongbox::schema::history_entry_t> history(
      uint64_t from_sequence,
      uint64_t to_sequence) const;

  /// Execute a read-path query by route; values are SCALE-encoded.
  strongbox::schema::query_result_t query(
      std::string_view path,
      const strongbox::schema::bytes_view_t& data) const;

  /// Install the notification sink.
  void set_event_sink(event_sink_t sink);

 private:
  /// Run `tx` in its own frame and append its history row.
  strongbox::schema::transaction_result_t execute_encoded(
      const strongbox::schema::transaction_t& tx,
      const strongbox::schema::bytes_t& raw_tx);

  /// Dispatch the payload to its handler.
  strongbox::schema::transaction_result_t execute_operation(
      const strongbox::schema::transaction_t& tx);

  strongbox::schema::transaction_result_t apply_deposit(
      const strongbox::schema::principal_id_t& signer,
      const strongbox::schema::deposit_t& deposit);
  strongbox::schema::transaction_result_t apply_withdraw(
      const strongbox::schema::principal_id_t& signer,
      const strongbox::schema::withdraw_t& withdraw);

  /// Seed roles, limits and the committed checkpoint of a fresh database.
  void bootstrap(const engine_config& config);

  strongbox::schema::committed_state_t committed_state() const;

  /// Record `event` as produced by the running operation.
  void emit(strongbox::schema::transaction_result_t& result,
            strongbox::schema::transaction_event_t event);

  /// Hand queued events to the sink once nothing is left uncommitted.
  void flush_events();

  state state_;
  permission_gate permissions_;
  asset_registry registry_;
  valuation_engine valuation_;
  ledger_store ledger_;
  capacity_guard guard_;
  external_transfer& transfer_;
  event_sink_t event_sink_;
  std::vector<strongbox::schema::transaction_event_t> pending_events_;
  bool transfer_in_progress_{false};
};

}  // namespace strongbox::execution
