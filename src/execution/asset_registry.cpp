#include <spdlog/spdlog.h>
#include <strongbox/execution/asset_registry.hpp>
#include <strongbox/schema/key/engine_keys.hpp>

#include <algorithm>
#include <iterator>

namespace strongbox::execution {

asset_registry::asset_registry(state& state,
                               const permission_gate& permissions,
                               const uint32_t max_assets)
    : state_{state}, permissions_{permissions}, max_assets_{max_assets} {}

std::optional<strongbox::schema::transaction_error_code>
asset_registry::register_asset(
    const strongbox::schema::principal_id_t& caller,
    const strongbox::schema::register_asset_t& registration) {
  if (auto denied =
          permissions_.require(caller, strongbox::schema::role_id_t::operator_)) {
    return denied;
  }

  auto encoder = encoder_t{};
  auto registered = list_registered();
  auto known = std::find(std::begin(registered), std::end(registered),
                         registration.asset_id) != std::end(registered);
  if (!known) {
    if (registered.size() >= max_assets_) {
      spdlog::warn("Asset registry is full ({} of {}); rejecting {}",
                   registered.size(), max_assets_,
                   strongbox::schema::to_hex(registration.asset_id));
      return strongbox::schema::transaction_error_code::capacity_exceeded;
    }
    registered.push_back(registration.asset_id);
    state_.put(strongbox::schema::key::make_registry_key(encoder), registered);
  }

  state_.put(
      strongbox::schema::key::make_asset_key(encoder, registration.asset_id),
      registration);
  return std::nullopt;
}

std::optional<strongbox::schema::price_source_id_t> asset_registry::lookup(
    const strongbox::schema::asset_id_t& asset_id) const {
  auto encoder = encoder_t{};
  auto registration = state_.get<strongbox::schema::asset_registration_t>(
      strongbox::schema::key::make_asset_key(encoder, asset_id));
  if (!registration) {
    return std::nullopt;
  }
  return registration->price_source_id;
}

strongbox::schema::registered_assets_t asset_registry::list_registered() const {
  auto encoder = encoder_t{};
  return state_
      .get<strongbox::schema::registered_assets_t>(
          strongbox::schema::key::make_registry_key(encoder))
      .value_or(strongbox::schema::registered_assets_t{});
}

}  // namespace strongbox::execution
