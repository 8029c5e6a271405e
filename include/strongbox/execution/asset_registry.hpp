#pragma once

#include <strongbox/execution/permission_gate.hpp>
#include <strongbox/execution/state.hpp>
#include <strongbox/schema/register_asset.hpp>
#include <strongbox/schema/transaction_error_code.hpp>
#include <cstdint>
#include <optional>

namespace strongbox::execution {

/// Bounded, append-only registry of valued assets.
///
/// The registration order is persisted as one sequence whose length never
/// exceeds `max_assets`; that bound caps the cost of every aggregation over
/// the registry.
class asset_registry final {
 public:
  asset_registry(state& state,
                 const permission_gate& permissions,
                 uint32_t max_assets);

  /// Register a new asset or replace the price feed of a known one.
  ///
  /// Requires the operator role. Fails `capacity_exceeded` when a new asset
  /// would grow the registry past `max_assets`.
  std::optional<strongbox::schema::transaction_error_code> register_asset(
      const strongbox::schema::principal_id_t& caller,
      const strongbox::schema::register_asset_t& registration);

  std::optional<strongbox::schema::price_source_id_t> lookup(
      const strongbox::schema::asset_id_t& asset_id) const;

  strongbox::schema::registered_assets_t list_registered() const;

 private:
  state& state_;
  const permission_gate& permissions_;
  uint32_t max_assets_{};
};

}  // namespace strongbox::execution
