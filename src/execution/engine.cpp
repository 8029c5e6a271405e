#include <spdlog/spdlog.h>
#include <cstddef>
#include <iterator>
#include <strongbox/blake3/hash.hpp>
#include <strongbox/execution/engine.hpp>
#include <strongbox/schema/key/engine_keys.hpp>
#include <strongbox/schema/query_error_code.hpp>
#include <tuple>
#include <utility>
#include <vector>

using namespace strongbox::schema;

namespace {

using encoder_t = strongbox::execution::encoder_t;

inline constexpr auto kExecuteCodespace = std::string_view{"strongbox.execute"};
inline constexpr auto kQueryCodespace = std::string_view{"strongbox.query"};

/// Marks the window in which the engine is inside an external transfer.
class transfer_scope final {
 public:
  explicit transfer_scope(bool& in_progress) : in_progress_{in_progress} {
    in_progress_ = true;
  }
  ~transfer_scope() { in_progress_ = false; }

  transfer_scope(const transfer_scope&) = delete;
  transfer_scope& operator=(const transfer_scope&) = delete;

 private:
  bool& in_progress_;
};

/// Queued events of one operation; dropped unless committed.
class event_scope final {
 public:
  explicit event_scope(std::vector<transaction_event_t>& events)
      : events_{events}, mark_{events.size()} {}
  ~event_scope() {
    if (open_) {
      discard();
    }
  }

  event_scope(const event_scope&) = delete;
  event_scope& operator=(const event_scope&) = delete;

  void commit() { open_ = false; }

  void rollback() {
    open_ = false;
    discard();
  }

 private:
  void discard() {
    if (mark_ < events_.size()) {
      events_.erase(
          std::next(std::begin(events_), static_cast<std::ptrdiff_t>(mark_)),
          std::end(events_));
    }
  }

  std::vector<transaction_event_t>& events_;
  std::size_t mark_;
  bool open_{true};
};

transaction_result_t reject(const transaction_error_code code,
                            std::string info) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{kExecuteCodespace};
  return result;
}

transaction_result_t accept(std::string info) {
  auto result = transaction_result_t{};
  result.info = std::move(info);
  return result;
}

transaction_event_attribute_t attribute(std::string key,
                                        std::string value,
                                        const bool index = false) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

std::string hex(const hash32_t& value) {
  return to_hex(bytes_view_t{value.data(), value.size()});
}

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         const uint64_t sequence) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 8);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  encoder.encode(sequence, material);
  return strongbox::blake3::hash(bytes_view_t{material.data(), material.size()});
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "undecodable transaction bytes";
  }
  return tx;
}

}  // namespace

namespace strongbox::execution {

engine::engine(
    strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>&
        storage,
    const engine_config& config,
    const price_oracle& oracle,
    const asset_metadata& metadata,
    external_transfer& transfer)
    : state_{storage},
      permissions_{state_},
      registry_{state_, permissions_, config.max_registered_assets},
      valuation_{registry_, oracle, metadata, config.common_decimals},
      ledger_{state_},
      guard_{state_, permissions_, registry_, valuation_, ledger_},
      transfer_{transfer} {
  spdlog::info(
      "Initializing ledger engine (common decimals {}, max {} assets)",
      config.common_decimals, config.max_registered_assets);
  bootstrap(config);
  auto committed = committed_state();
  spdlog::info("Ledger engine ready at sequence {} with {} registered asset(s)",
               committed.sequence, registry_.list_registered().size());
}

transaction_result_t engine::check_transaction(
    const bytes_view_t& raw_tx) const {
  auto error = std::string{};
  auto tx = decode_transaction(raw_tx, error);
  if (!tx) {
    return reject(transaction_error_code::invalid_transaction, error);
  }
  if (tx->version != 1) {
    return reject(transaction_error_code::unsupported_transaction_version,
                  "expected version 1");
  }
  return accept("transaction is well formed");
}

transaction_result_t engine::execute(const bytes_view_t& raw_tx) {
  auto error = std::string{};
  auto tx = decode_transaction(raw_tx, error);
  if (!tx) {
    return reject(transaction_error_code::invalid_transaction, error);
  }
  if (tx->version != 1) {
    return reject(transaction_error_code::unsupported_transaction_version,
                  "expected version 1");
  }
  return execute_encoded(*tx, make_bytes(raw_tx));
}

transaction_result_t engine::execute(const transaction_t& tx) {
  if (tx.version != 1) {
    return reject(transaction_error_code::unsupported_transaction_version,
                  "expected version 1");
  }
  auto encoder = encoder_t{};
  return execute_encoded(tx, encoder.encode(tx));
}

transaction_result_t engine::deposit(const principal_id_t& signer,
                                     const asset_id_t& asset_id,
                                     const amount_t& amount) {
  return execute(transaction_t{
      .signer = signer,
      .payload = deposit_t{.asset_id = asset_id, .amount = amount}});
}

transaction_result_t engine::withdraw(const principal_id_t& signer,
                                      const asset_id_t& asset_id,
                                      const amount_t& amount) {
  return execute(transaction_t{
      .signer = signer,
      .payload = withdraw_t{.asset_id = asset_id, .amount = amount}});
}

transaction_result_t engine::register_asset(
    const principal_id_t& signer,
    const asset_id_t& asset_id,
    const price_source_id_t& price_source_id) {
  return execute(transaction_t{
      .signer = signer,
      .payload = register_asset_t{.asset_id = asset_id,
                                  .price_source_id = price_source_id}});
}

transaction_result_t engine::set_capacity_limit(const principal_id_t& signer,
                                                const value_t& limit) {
  return execute(transaction_t{.signer = signer,
                               .payload = set_capacity_limit_t{.limit = limit}});
}

transaction_result_t engine::set_withdraw_limit(const principal_id_t& signer,
                                                const amount_t& limit) {
  return execute(transaction_t{.signer = signer,
                               .payload = set_withdraw_limit_t{.limit = limit}});
}

transaction_result_t engine::upsert_role_assignment(
    const principal_id_t& signer,
    const upsert_role_assignment_t& assignment) {
  return execute(transaction_t{.signer = signer, .payload = assignment});
}

transaction_result_t engine::receive_direct_transfer(
    const principal_id_t& sender,
    const asset_id_t& asset_id,
    const amount_t& amount) {
  return execute(transaction_t{
      .signer = sender,
      .payload = direct_transfer_t{.asset_id = asset_id, .amount = amount}});
}

transaction_result_t engine::execute_encoded(const transaction_t& tx,
                                             const bytes_t& raw_tx) {
  auto events = event_scope{pending_events_};

  // Outer frame: history row and checkpoint. Inner frame: the operation.
  auto tx_frame = frame_scope{state_};
  auto operation_frame = frame_scope{state_};
  auto result = execute_operation(tx);
  if (result.code == 0) {
    operation_frame.commit();
  } else {
    operation_frame.rollback();
    events.rollback();
  }

  auto encoder = encoder_t{};
  auto committed = committed_state();
  ++committed.sequence;
  if (result.code == 0) {
    committed.state_root =
        fold_state_root(committed.state_root, raw_tx, committed.sequence);
  }
  state_.put(key::make_history_key(encoder, committed.sequence),
             history_entry_t{.sequence = committed.sequence,
                             .code = result.code,
                             .tx = raw_tx});
  state_.put(key::make_committed_key(encoder), committed);
  tx_frame.commit();
  events.commit();

  if (result.code == 0) {
    spdlog::debug("Transaction {} applied: {}", committed.sequence,
                  result.info);
  } else {
    spdlog::debug("Transaction {} rejected with {}: {}", committed.sequence,
                  result.log, result.info);
  }

  if (state_.depth() == 0) {
    flush_events();
  }
  return result;
}

transaction_result_t engine::execute_operation(const transaction_t& tx) {
  return std::visit(
      overloaded{
          [&](const deposit_t& operation) {
            return apply_deposit(tx.signer, operation);
          },
          [&](const withdraw_t& operation) {
            return apply_withdraw(tx.signer, operation);
          },
          [&](const register_asset_t& operation) {
            if (auto error = registry_.register_asset(tx.signer, operation)) {
              return reject(*error, "asset registration rejected");
            }
            auto result = accept("register_asset accepted");
            emit(result,
                 transaction_event_t{
                     .type = "asset_configured",
                     .attributes = {
                         attribute("operator", hex(tx.signer), true),
                         attribute("asset", hex(operation.asset_id), true),
                         attribute("price_source",
                                   hex(operation.price_source_id))}});
            return result;
          },
          [&](const set_capacity_limit_t& operation) {
            if (auto error =
                    guard_.set_capacity_limit(tx.signer, operation.limit)) {
              return reject(*error, "capacity limit change rejected");
            }
            auto result = accept("set_capacity_limit accepted");
            emit(result,
                 transaction_event_t{
                     .type = "capacity_limit_changed",
                     .attributes = {attribute("operator", hex(tx.signer), true),
                                    attribute("limit", operation.limit.str())}});
            return result;
          },
          [&](const set_withdraw_limit_t& operation) {
            if (auto error =
                    guard_.set_withdraw_limit(tx.signer, operation.limit)) {
              return reject(*error, "withdraw limit change rejected");
            }
            auto result = accept("set_withdraw_limit accepted");
            emit(result,
                 transaction_event_t{
                     .type = "withdraw_limit_changed",
                     .attributes = {attribute("operator", hex(tx.signer), true),
                                    attribute("limit", operation.limit.str())}});
            return result;
          },
          [&](const upsert_role_assignment_t& operation) {
            if (auto error = permissions_.upsert(tx.signer, operation)) {
              return reject(*error, "role assignment rejected");
            }
            auto result = accept("upsert_role_assignment accepted");
            emit(result,
                 transaction_event_t{
                     .type = "role_assignment_changed",
                     .attributes = {
                         attribute("admin", hex(tx.signer), true),
                         attribute("subject", hex(operation.subject), true),
                         attribute("role", std::string{to_string(operation.role)}),
                         attribute("enabled",
                                   operation.enabled ? "true" : "false")}});
            return result;
          },
          [&](const direct_transfer_t& operation) {
            spdlog::warn("Rejected unsolicited transfer of {} of asset {} from {}",
                         operation.amount.str(), hex(operation.asset_id),
                         hex(tx.signer));
            return reject(transaction_error_code::invalid_direct_transfer,
                          "value must arrive through deposit");
          }},
      tx.payload);
}

transaction_result_t engine::apply_deposit(const principal_id_t& signer,
                                           const deposit_t& deposit) {
  if (deposit.amount == 0) {
    return reject(transaction_error_code::nothing_to_deposit,
                  "deposit amount is zero");
  }
  if (auto error = guard_.check_capacity(deposit.asset_id, deposit.amount)) {
    return reject(*error, "deposit failed the capacity check");
  }
  if (transfer_in_progress_) {
    return reject(transaction_error_code::reentrant_call,
                  "deposit entered during an external transfer");
  }

  auto scope = transfer_scope{transfer_in_progress_};
  // Credit before pulling: a callback during the pull already sees the credit.
  if (auto error = ledger_.credit(signer, deposit.asset_id, deposit.amount)) {
    return reject(*error, "ledger credit failed");
  }
  if (!transfer_.pull_from(signer, deposit.asset_id, deposit.amount)) {
    spdlog::warn("Inbound transfer of {} of asset {} from {} failed",
                 deposit.amount.str(), hex(deposit.asset_id), hex(signer));
    return reject(transaction_error_code::failed_transfer,
                  "inbound transfer failed");
  }

  auto result = accept("deposit accepted");
  emit(result, transaction_event_t{
                   .type = "deposited",
                   .attributes = {attribute("principal", hex(signer), true),
                                  attribute("asset", hex(deposit.asset_id), true),
                                  attribute("amount", deposit.amount.str())}});
  return result;
}

transaction_result_t engine::apply_withdraw(const principal_id_t& signer,
                                            const withdraw_t& withdraw) {
  if (withdraw.amount == 0) {
    return reject(transaction_error_code::nothing_to_withdraw,
                  "withdraw amount is zero");
  }
  if (withdraw.amount > ledger_.balance_of(signer, withdraw.asset_id)) {
    return reject(transaction_error_code::insufficient_balance,
                  "withdraw exceeds balance");
  }
  if (auto error = guard_.check_withdraw_limit(withdraw.amount)) {
    return reject(*error, "withdraw exceeds the per-operation limit");
  }
  if (transfer_in_progress_) {
    return reject(transaction_error_code::reentrant_call,
                  "withdraw entered during an external transfer");
  }

  auto scope = transfer_scope{transfer_in_progress_};
  // Debit before pushing: a callback during the push sees the reduced balance.
  if (auto error = ledger_.debit(signer, withdraw.asset_id, withdraw.amount)) {
    return reject(*error, "ledger debit failed");
  }
  if (!transfer_.push_to(signer, withdraw.asset_id, withdraw.amount)) {
    spdlog::warn("Outbound transfer of {} of asset {} to {} failed",
                 withdraw.amount.str(), hex(withdraw.asset_id), hex(signer));
    return reject(transaction_error_code::failed_transfer,
                  "outbound transfer failed");
  }

  auto result = accept("withdraw accepted");
  emit(result,
       transaction_event_t{
           .type = "withdrew",
           .attributes = {attribute("principal", hex(signer), true),
                          attribute("asset", hex(withdraw.asset_id), true),
                          attribute("amount", withdraw.amount.str())}});
  return result;
}

void engine::bootstrap(const engine_config& config) {
  auto encoder = encoder_t{};
  if (state_.get_raw(key::make_committed_key(encoder))) {
    spdlog::debug("Loading persisted ledger state");
    return;
  }

  spdlog::info("Bootstrapping fresh ledger for deployer {}",
               hex(config.deployer));
  auto frame = frame_scope{state_};
  permissions_.assign(role_assignment_state_t{
      .subject = config.deployer, .role = role_id_t::admin, .enabled = true});
  permissions_.assign(role_assignment_state_t{.subject = config.deployer,
                                              .role = role_id_t::operator_,
                                              .enabled = true});
  guard_.initialize(limits_t{.capacity_limit = config.capacity_limit,
                             .withdraw_limit = config.withdraw_limit});
  state_.put(key::make_committed_key(encoder), committed_state_t{});
  frame.commit();
  if (config.capacity_limit == 0) {
    spdlog::warn(
        "Capacity limit is 0; deposits with nonzero value will be rejected");
  }
}

committed_state_t engine::committed_state() const {
  auto encoder = encoder_t{};
  return state_.get<committed_state_t>(key::make_committed_key(encoder))
      .value_or(committed_state_t{});
}

void engine::emit(transaction_result_t& result, transaction_event_t event) {
  result.events.push_back(event);
  pending_events_.push_back(std::move(event));
}

void engine::flush_events() {
  auto events = std::move(pending_events_);
  pending_events_.clear();
  if (!event_sink_) {
    return;
  }
  for (const auto& event : events) {
    event_sink_(event);
  }
}

void engine::set_event_sink(event_sink_t sink) {
  event_sink_ = std::move(sink);
}

amount_t engine::balance_of(const principal_id_t& principal,
                            const asset_id_t& asset_id) const {
  return ledger_.balance_of(principal, asset_id);
}

amount_t engine::held(const asset_id_t& asset_id) const {
  return ledger_.held(asset_id);
}

operation_counters_t engine::counters_of(
    const principal_id_t& principal) const {
  return ledger_.counters_of(principal);
}

limits_t engine::limits() const {
  return guard_.limits();
}

value_t engine::capacity_limit() const {
  return guard_.limits().capacity_limit;
}

amount_t engine::withdraw_limit() const {
  return guard_.limits().withdraw_limit;
}

registered_assets_t engine::registered_assets() const {
  return registry_.list_registered();
}

std::optional<price_source_id_t> engine::price_source_of(
    const asset_id_t& asset_id) const {
  return registry_.lookup(asset_id);
}

valuation_t engine::value_of(const asset_id_t& asset_id,
                             const amount_t& amount) const {
  return valuation_.value_of(asset_id, amount);
}

valuation_t engine::total_value() const {
  return guard_.total_value();
}

bool engine::has_role(const principal_id_t& principal,
                      const role_id_t role) const {
  return permissions_.has_role(principal, role);
}

app_info_t engine::info() const {
  auto committed = committed_state();
  auto result = app_info_t{};
  result.last_sequence = committed.sequence;
  result.state_root = committed.state_root;
  return result;
}

std::vector<history_entry_t> engine::history(
    const uint64_t from_sequence,
    const uint64_t to_sequence) const {
  auto encoder = encoder_t{};
  if (from_sequence > to_sequence) {
    return {};
  }
  auto first = key::make_history_key(encoder, from_sequence);
  auto last = key::make_history_key(encoder, to_sequence);
  auto rows = state_.storage().list_range(
      bytes_view_t{first.data(), first.size()},
      bytes_view_t{last.data(), last.size()});

  auto entries = std::vector<history_entry_t>{};
  entries.reserve(rows.size());
  for (const auto& [row_key, row_value] : rows) {
    entries.push_back(encoder.decode<history_entry_t>(
        bytes_view_t{row_value.data(), row_value.size()}));
  }
  return entries;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto encoder = encoder_t{};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.sequence = committed_state().sequence;
  result.codespace = std::string{kQueryCodespace};

  auto fail = [&](const query_error_code code, std::string log,
                  std::string info = {}) {
    result.code = static_cast<uint32_t>(code);
    result.log = std::move(log);
    result.info = std::move(info);
    return result;
  };

  if (path == "/engine/info") {
    auto committed = committed_state();
    result.value =
        encoder.encode(std::tuple{committed.sequence, committed.state_root});
    return result;
  }
  if (path == "/ledger/balance") {
    auto key = encoder.try_decode<std::tuple<principal_id_t, asset_id_t>>(data);
    if (!key) {
      return fail(query_error_code::invalid_key,
                  "expected (principal, asset) key");
    }
    result.value =
        encoder.encode(balance_of(std::get<0>(*key), std::get<1>(*key)));
    return result;
  }
  if (path == "/ledger/counters") {
    auto key = encoder.try_decode<principal_id_t>(data);
    if (!key) {
      return fail(query_error_code::invalid_key, "expected principal key");
    }
    result.value = encoder.encode(counters_of(*key));
    return result;
  }
  if (path == "/ledger/held") {
    auto key = encoder.try_decode<asset_id_t>(data);
    if (!key) {
      return fail(query_error_code::invalid_key, "expected asset key");
    }
    result.value = encoder.encode(held(*key));
    return result;
  }
  if (path == "/limits/capacity") {
    result.value = encoder.encode(capacity_limit());
    return result;
  }
  if (path == "/limits/withdraw") {
    result.value = encoder.encode(withdraw_limit());
    return result;
  }
  if (path == "/registry/assets") {
    result.value = encoder.encode(registered_assets());
    return result;
  }
  if (path == "/registry/asset") {
    auto key = encoder.try_decode<asset_id_t>(data);
    if (!key) {
      return fail(query_error_code::invalid_key, "expected asset key");
    }
    auto source = price_source_of(*key);
    if (!source) {
      return fail(query_error_code::not_found, "asset is not registered");
    }
    result.value = encoder.encode(*source);
    return result;
  }
  if (path == "/valuation/value" || path == "/valuation/total") {
    auto valued = valuation_t{};
    if (path == "/valuation/total") {
      valued = total_value();
    } else {
      auto key = encoder.try_decode<std::tuple<asset_id_t, amount_t>>(data);
      if (!key) {
        return fail(query_error_code::invalid_key,
                    "expected (asset, amount) key");
      }
      valued = value_of(std::get<0>(*key), std::get<1>(*key));
    }
    if (valued.code != 0) {
      return fail(query_error_code::valuation_failed, "valuation failed",
                  std::string{to_string(
                      static_cast<transaction_error_code>(valued.code))});
    }
    result.value = encoder.encode(valued.value);
    return result;
  }
  if (path == "/history/range") {
    auto key = encoder.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!key) {
      return fail(query_error_code::invalid_key, "expected (from, to) key");
    }
    result.value =
        encoder.encode(history(std::get<0>(*key), std::get<1>(*key)));
    return result;
  }
  return fail(query_error_code::unsupported_path, "unsupported query path");
}

}  // namespace strongbox::execution
