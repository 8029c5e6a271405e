#pragma once

#include <strongbox/execution/state.hpp>
#include <strongbox/schema/operation_counters.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/schema/transaction_error_code.hpp>
#include <optional>

namespace strongbox::execution {

/// Per-principal balances, per-asset held totals and operation counters.
class ledger_store final {
 public:
  explicit ledger_store(state& state);

  strongbox::schema::amount_t balance_of(
      const strongbox::schema::principal_id_t& principal,
      const strongbox::schema::asset_id_t& asset_id) const;

  /// Sum of every principal's balance of `asset_id`.
  strongbox::schema::amount_t held(
      const strongbox::schema::asset_id_t& asset_id) const;

  strongbox::schema::operation_counters_t counters_of(
      const strongbox::schema::principal_id_t& principal) const;

  std::optional<strongbox::schema::transaction_error_code> credit(
      const strongbox::schema::principal_id_t& principal,
      const strongbox::schema::asset_id_t& asset_id,
      const strongbox::schema::amount_t& amount);

  std::optional<strongbox::schema::transaction_error_code> debit(
      const strongbox::schema::principal_id_t& principal,
      const strongbox::schema::asset_id_t& asset_id,
      const strongbox::schema::amount_t& amount);

 private:
  void write_amount(const strongbox::schema::bytes_t& key,
                    const strongbox::schema::amount_t& amount);

  state& state_;
};

}  // namespace strongbox::execution
