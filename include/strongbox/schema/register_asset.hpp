#pragma once
#include <strongbox/schema/primitives.hpp>

// Schema type: register asset.
// Ledger workflow: binds an asset to the price feed that values it. The same
// record is the persisted registry entry.
namespace strongbox::schema {

template <uint16_t Version>
struct register_asset;

template <>
struct register_asset<1> final {
  uint16_t version{1};
  asset_id_t asset_id{};
  price_source_id_t price_source_id{};
};

using register_asset_t = register_asset<1>;
using asset_registration_t = register_asset<1>;

/// Registration order of every asset in the registry.
using registered_assets_t = std::vector<asset_id_t>;

}  // namespace strongbox::schema
