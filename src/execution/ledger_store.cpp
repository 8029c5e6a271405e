#include <strongbox/execution/ledger_store.hpp>
#include <strongbox/schema/key/engine_keys.hpp>

#include <limits>

using namespace strongbox::schema;

namespace strongbox::execution {

ledger_store::ledger_store(state& state) : state_{state} {}

amount_t ledger_store::balance_of(const principal_id_t& principal,
                                  const asset_id_t& asset_id) const {
  auto encoder = encoder_t{};
  return state_
      .get<amount_t>(key::make_balance_key(encoder, principal, asset_id))
      .value_or(amount_t{0});
}

amount_t ledger_store::held(const asset_id_t& asset_id) const {
  auto encoder = encoder_t{};
  return state_.get<amount_t>(key::make_held_key(encoder, asset_id))
      .value_or(amount_t{0});
}

operation_counters_t ledger_store::counters_of(
    const principal_id_t& principal) const {
  auto encoder = encoder_t{};
  return state_
      .get<operation_counters_t>(key::make_counters_key(encoder, principal))
      .value_or(operation_counters_t{});
}

std::optional<transaction_error_code> ledger_store::credit(
    const principal_id_t& principal,
    const asset_id_t& asset_id,
    const amount_t& amount) {
  if (amount == 0) {
    return transaction_error_code::nothing_to_deposit;
  }

  auto encoder = encoder_t{};
  auto balance = balance_of(principal, asset_id);
  auto total = held(asset_id);
  // The held total bounds every balance, so checking it covers both sums.
  if (total > std::numeric_limits<amount_t>::max() - amount) {
    return transaction_error_code::arithmetic_overflow;
  }

  write_amount(key::make_balance_key(encoder, principal, asset_id),
               balance + amount);
  write_amount(key::make_held_key(encoder, asset_id), total + amount);

  auto counters = counters_of(principal);
  ++counters.deposits;
  state_.put(key::make_counters_key(encoder, principal), counters);
  return std::nullopt;
}

std::optional<transaction_error_code> ledger_store::debit(
    const principal_id_t& principal,
    const asset_id_t& asset_id,
    const amount_t& amount) {
  if (amount == 0) {
    return transaction_error_code::nothing_to_withdraw;
  }

  auto encoder = encoder_t{};
  auto balance = balance_of(principal, asset_id);
  if (amount > balance) {
    return transaction_error_code::insufficient_balance;
  }

  write_amount(key::make_balance_key(encoder, principal, asset_id),
               balance - amount);
  write_amount(key::make_held_key(encoder, asset_id), held(asset_id) - amount);

  auto counters = counters_of(principal);
  ++counters.withdrawals;
  state_.put(key::make_counters_key(encoder, principal), counters);
  return std::nullopt;
}

void ledger_store::write_amount(const bytes_t& key, const amount_t& amount) {
  if (amount == 0) {
    state_.erase(key);
  } else {
    state_.put(key, amount);
  }
}

}  // namespace strongbox::execution
