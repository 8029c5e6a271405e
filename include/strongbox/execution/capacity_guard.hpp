#pragma once

#include <strongbox/execution/asset_registry.hpp>
#include <strongbox/execution/ledger_store.hpp>
#include <strongbox/execution/permission_gate.hpp>
#include <strongbox/execution/state.hpp>
#include <strongbox/execution/valuation_engine.hpp>
#include <strongbox/schema/limits.hpp>
#include <strongbox/schema/transaction_error_code.hpp>
#include <strongbox/schema/valuation.hpp>
#include <optional>

namespace strongbox::execution {

/// Enforces the aggregate capacity and the per-withdrawal limit.
class capacity_guard final {
 public:
  capacity_guard(state& state,
                 const permission_gate& permissions,
                 const asset_registry& registry,
                 const valuation_engine& valuation,
                 const ledger_store& ledger);

  strongbox::schema::limits_t limits() const;

  /// Persist limits without any role check (bootstrap path).
  void initialize(const strongbox::schema::limits_t& limits);

  /// Current value of everything held, at current prices.
  strongbox::schema::valuation_t total_value() const;

  /// Fails `capacity_exceeded` when the holdings plus the incoming amount are
  /// worth more than the capacity limit; valuation failures pass through.
  std::optional<strongbox::schema::transaction_error_code> check_capacity(
      const strongbox::schema::asset_id_t& asset_id,
      const strongbox::schema::amount_t& amount) const;

  std::optional<strongbox::schema::transaction_error_code>
  check_withdraw_limit(const strongbox::schema::amount_t& amount) const;

  std::optional<strongbox::schema::transaction_error_code> set_capacity_limit(
      const strongbox::schema::principal_id_t& caller,
      const strongbox::schema::value_t& limit);

  std::optional<strongbox::schema::transaction_error_code> set_withdraw_limit(
      const strongbox::schema::principal_id_t& caller,
      const strongbox::schema::amount_t& limit);

 private:
  state& state_;
  const permission_gate& permissions_;
  const asset_registry& registry_;
  const valuation_engine& valuation_;
  const ledger_store& ledger_;
};

}  // namespace strongbox::execution
