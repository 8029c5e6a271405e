#include <spdlog/spdlog.h>
#include <strongbox/execution/capacity_guard.hpp>
#include <strongbox/schema/key/engine_keys.hpp>

#include <limits>

using namespace strongbox::schema;

namespace strongbox::execution {

capacity_guard::capacity_guard(state& state,
                               const permission_gate& permissions,
                               const asset_registry& registry,
                               const valuation_engine& valuation,
                               const ledger_store& ledger)
    : state_{state},
      permissions_{permissions},
      registry_{registry},
      valuation_{valuation},
      ledger_{ledger} {}

limits_t capacity_guard::limits() const {
  auto encoder = encoder_t{};
  return state_.get<limits_t>(key::make_limits_key(encoder))
      .value_or(limits_t{});
}

void capacity_guard::initialize(const limits_t& limits) {
  auto encoder = encoder_t{};
  state_.put(key::make_limits_key(encoder), limits);
}

valuation_t capacity_guard::total_value() const {
  auto total = value_t{0};
  // Bounded by the registry's maximum length.
  for (const auto& asset_id : registry_.list_registered()) {
    auto held = ledger_.held(asset_id);
    if (held == 0) {
      continue;
    }
    auto valued = valuation_.value_of(asset_id, held);
    if (valued.code != 0) {
      return valued;
    }
    if (total > std::numeric_limits<value_t>::max() - valued.value) {
      return make_valuation_error(transaction_error_code::arithmetic_overflow);
    }
    total += valued.value;
  }
  return valuation_t{.value = total};
}

std::optional<transaction_error_code> capacity_guard::check_capacity(
    const asset_id_t& asset_id,
    const amount_t& amount) const {
  auto incoming = valuation_.value_of(asset_id, amount);
  if (incoming.code != 0) {
    return static_cast<transaction_error_code>(incoming.code);
  }
  auto current = total_value();
  if (current.code != 0) {
    return static_cast<transaction_error_code>(current.code);
  }

  auto capacity = limits().capacity_limit;
  if (current.value > capacity || incoming.value > capacity - current.value) {
    spdlog::debug("Capacity check failed: held {} + incoming {} > limit {}",
                  current.value.str(), incoming.value.str(), capacity.str());
    return transaction_error_code::capacity_exceeded;
  }
  return std::nullopt;
}

std::optional<transaction_error_code> capacity_guard::check_withdraw_limit(
    const amount_t& amount) const {
  if (amount > limits().withdraw_limit) {
    return transaction_error_code::withdraw_limit_exceeded;
  }
  return std::nullopt;
}

std::optional<transaction_error_code> capacity_guard::set_capacity_limit(
    const principal_id_t& caller,
    const value_t& limit) {
  if (auto denied = permissions_.require(caller, role_id_t::operator_)) {
    return denied;
  }
  auto current = limits();
  current.capacity_limit = limit;
  initialize(current);
  return std::nullopt;
}

std::optional<transaction_error_code> capacity_guard::set_withdraw_limit(
    const principal_id_t& caller,
    const amount_t& limit) {
  if (auto denied = permissions_.require(caller, role_id_t::operator_)) {
    return denied;
  }
  auto current = limits();
  current.withdraw_limit = limit;
  initialize(current);
  return std::nullopt;
}

}  // namespace strongbox::execution
